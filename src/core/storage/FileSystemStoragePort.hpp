#pragma once

#include "interfaces/IStoragePort.hpp"
#include <atomic>

namespace photo_pairing::storage {

    /**
     * @brief IStoragePort over std::filesystem
     *
     * Publishing uses a hard link, which fails if the target exists, so an
     * existing photo is never replaced. Filesystems without hard links fall
     * back to an existence check followed by rename.
     */
    class FileSystemStoragePort : public IStoragePort {
    public:
        bool exists(const std::string& path) const override;
        void createDirectories(const std::string& directory) override;
        std::string writeTemporary(const std::string& directory,
                                   const std::vector<unsigned char>& bytes) override;
        bool publishIfAbsent(const std::string& temporary_path,
                             const std::string& final_path) override;
        void discard(const std::string& temporary_path) noexcept override;

    private:
        std::atomic<unsigned long> temp_counter_{0};
    };

} // namespace photo_pairing::storage
