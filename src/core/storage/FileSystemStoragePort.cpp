#include "FileSystemStoragePort.hpp"
#include "photo_pairing/logging.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace photo_pairing::storage {

    bool FileSystemStoragePort::exists(const std::string& path) const {
        std::error_code ec;
        return fs::exists(path, ec);
    }

    void FileSystemStoragePort::createDirectories(const std::string& directory) {
        std::error_code ec;
        fs::create_directories(directory, ec);
        if (ec) {
            throw std::runtime_error("cannot create directory " + directory + ": " + ec.message());
        }
    }

    std::string FileSystemStoragePort::writeTemporary(const std::string& directory,
                                                      const std::vector<unsigned char>& bytes) {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        const auto path = (fs::path(directory) /
                           (".incoming-" + std::to_string(::getpid()) + "-" +
                            std::to_string(temp_counter_.fetch_add(1)) + "-" +
                            std::to_string(stamp) + ".tmp")).string();

        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("cannot open temporary file " + path);
        }
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            out.close();
            discard(path);
            throw std::runtime_error("short write to temporary file " + path);
        }
        return path;
    }

    bool FileSystemStoragePort::publishIfAbsent(const std::string& temporary_path,
                                                const std::string& final_path) {
        std::error_code ec;
        fs::create_hard_link(temporary_path, final_path, ec);
        if (!ec) {
            discard(temporary_path);
            return true;
        }
        if (ec == std::errc::file_exists) {
            return false;
        }
        if (ec != std::errc::operation_not_permitted && ec != std::errc::operation_not_supported &&
            ec != std::errc::function_not_supported) {
            throw std::runtime_error("cannot publish " + final_path + ": " + ec.message());
        }

        // No hard links here; callers hold the directory lock, so check-then-rename is safe
        LOG_DEBUG("Hard links unavailable for " + final_path + ", using rename");
        if (fs::exists(final_path, ec)) {
            return false;
        }
        fs::rename(temporary_path, final_path, ec);
        if (ec) {
            throw std::runtime_error("cannot publish " + final_path + ": " + ec.message());
        }
        return true;
    }

    void FileSystemStoragePort::discard(const std::string& temporary_path) noexcept {
        std::error_code ec;
        fs::remove(temporary_path, ec);
        if (ec) {
            LOG_WARNING("Could not remove temporary file " + temporary_path + ": " + ec.message());
        }
    }

} // namespace photo_pairing::storage
