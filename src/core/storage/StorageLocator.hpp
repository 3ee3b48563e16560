#pragma once

#include "interfaces/IStoragePort.hpp"
#include "photo_pairing/types.hpp"
#include <ctime>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace photo_pairing::storage {

    /**
     * @brief What StorageLocator needs to know about a classified photo
     */
    struct PlacementRequest {
        std::time_t captured_at = 0;
        std::string site;
        std::string task;
        Phase phase = Phase::REJECTED;
        std::string original_name;  ///< Source of the extension and preferred label
        std::string caption;        ///< Label used when there is no original name
    };

    /**
     * @brief Places classified photos under
     *        <save_root>/<YYYY>-<MM>/<site>/<task>/<before|after>/
     *
     * Filenames are <site-lower>_<task>_<phase>_<YYYYMMDD_HHMMSS>[_<label>]<ext>.
     * A collision appends -1, -2, ... before the extension. Existing files
     * are never replaced, and placements into the same directory are
     * serialized.
     */
    class StorageLocator {
    public:
        StorageLocator(std::shared_ptr<IStoragePort> port,
                       StorageParams params,
                       int utc_offset_minutes);

        /**
         * @brief Directory a photo belongs to; pure
         * @throws std::invalid_argument for REJECTED or an unusable site/task
         */
        std::string directoryFor(std::time_t captured_at,
                                 const std::string& site,
                                 const std::string& task,
                                 Phase phase) const;

        /// Filename before collision handling; pure.
        std::string baseFilename(const PlacementRequest& request) const;

        /**
         * @brief Write @p bytes to a fresh path for @p request
         * @return The stored path
         * @throws std::invalid_argument for REJECTED input
         * @throws StorageFailure if the write does not complete; nothing is left behind
         */
        std::string place(const PlacementRequest& request, const std::vector<unsigned char>& bytes);

        const StorageParams& params() const { return params_; }

        static constexpr int kMaxCollisionSuffix = 10000;
        static constexpr size_t kMaxLabelLength = 40;

    private:
        std::shared_ptr<std::mutex> directoryMutex(const std::string& directory);

        std::shared_ptr<IStoragePort> port_;
        StorageParams params_;
        int utc_offset_minutes_;

        std::mutex registry_mutex_;
        std::map<std::string, std::shared_ptr<std::mutex>> directory_mutexes_;
    };

    /**
     * @brief Replace every run of characters outside [A-Za-z0-9_-] with '_'
     *
     * The result is truncated to @p max_length characters when non-zero.
     */
    std::string sanitizeLabel(const std::string& text, size_t max_length = 0);

    /**
     * @brief Site or task name as it appears in the store
     *
     * sanitizeLabel() applied to @p value. Every lookup of a stored group
     * goes through this so "North Park" and "North_Park" name the same
     * directory.
     * @throws std::invalid_argument when nothing but separators remains
     *         ("", "..", "__")
     */
    std::string storeComponent(const std::string& value, const std::string& what);

    /// Lower-case extension including the dot, or "" if there is none.
    std::string extensionOf(const std::string& filename);

    /// .jpg .jpeg .png .bmp .tif .tiff .webp (case-insensitive)
    bool isImageExtension(const std::string& extension);

} // namespace photo_pairing::storage
