#pragma once

#include <string>
#include <vector>

namespace photo_pairing {

    /**
     * @brief Narrow filesystem seam used by StorageLocator
     *
     * Paths are plain strings joined with '/'. Implementations must make
     * publishIfAbsent atomic: either the final path appears with the full
     * content, or nothing appears.
     */
    class IStoragePort {
    public:
        virtual ~IStoragePort() = default;

        virtual bool exists(const std::string& path) const = 0;

        /**
         * @brief Create @p directory and any missing parents (idempotent)
         * @throws std::runtime_error on failure
         */
        virtual void createDirectories(const std::string& directory) = 0;

        /**
         * @brief Write @p bytes to a new temporary file inside @p directory
         * @return Path of the temporary file
         * @throws std::runtime_error on failure (nothing is left behind)
         */
        virtual std::string writeTemporary(const std::string& directory,
                                           const std::vector<unsigned char>& bytes) = 0;

        /**
         * @brief Move a temporary file to @p final_path unless that path exists
         * @return false if @p final_path already exists (temporary is kept)
         * @throws std::runtime_error on any other failure
         */
        virtual bool publishIfAbsent(const std::string& temporary_path,
                                     const std::string& final_path) = 0;

        /// Remove a temporary file; never throws.
        virtual void discard(const std::string& temporary_path) noexcept = 0;
    };

} // namespace photo_pairing
