#include "StorageLocator.hpp"
#include "src/core/classification/CaptureTime.hpp"
#include "photo_pairing/errors.hpp"
#include "photo_pairing/logging.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace photo_pairing::storage {

namespace {

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool isLabelChar(unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '-';
}

}

    std::string storeComponent(const std::string& value, const std::string& what) {
        const auto cleaned = sanitizeLabel(value);
        const bool has_alnum = std::any_of(cleaned.begin(), cleaned.end(),
                                           [](unsigned char c) { return std::isalnum(c) != 0; });
        if (!has_alnum) {
            throw std::invalid_argument(what + " label '" + value + "' has no letters or digits");
        }
        return cleaned;
    }

    std::string sanitizeLabel(const std::string& text, size_t max_length) {
        std::string out;
        out.reserve(text.size());
        bool in_run = false;
        for (const char ch : text) {
            if (isLabelChar(static_cast<unsigned char>(ch))) {
                out.push_back(ch);
                in_run = false;
            } else if (!in_run) {
                out.push_back('_');
                in_run = true;
            }
        }
        if (max_length > 0 && out.size() > max_length) {
            out.resize(max_length);
        }
        return out;
    }

    std::string extensionOf(const std::string& filename) {
        return toLowerCopy(fs::path(filename).extension().string());
    }

    bool isImageExtension(const std::string& extension) {
        static const std::array<const char*, 7> kExtensions = {
            ".jpg", ".jpeg", ".png", ".bmp", ".tif", ".tiff", ".webp"
        };
        const auto lowered = toLowerCopy(extension);
        return std::any_of(kExtensions.begin(), kExtensions.end(),
                           [&lowered](const char* ext) { return lowered == ext; });
    }

    StorageLocator::StorageLocator(std::shared_ptr<IStoragePort> port,
                                   StorageParams params,
                                   int utc_offset_minutes)
        : port_(std::move(port)),
          params_(std::move(params)),
          utc_offset_minutes_(utc_offset_minutes) {
        if (!port_) {
            throw std::invalid_argument("StorageLocator requires a storage port");
        }
        if (params_.save_root.empty()) {
            throw ConfigurationError("SAVE_ROOT is required");
        }
    }

    std::string StorageLocator::directoryFor(std::time_t captured_at,
                                             const std::string& site,
                                             const std::string& task,
                                             Phase phase) const {
        if (phase == Phase::REJECTED) {
            throw std::invalid_argument("rejected photos have no storage directory");
        }
        const auto local = classification::toLocalDateTime(captured_at, utc_offset_minutes_);
        const fs::path dir = fs::path(params_.save_root) /
                             classification::formatMonthKey(local) /
                             storeComponent(site, "site") /
                             storeComponent(task, "task") /
                             toString(phase);
        return dir.string();
    }

    std::string StorageLocator::baseFilename(const PlacementRequest& request) const {
        const auto local = classification::toLocalDateTime(request.captured_at, utc_offset_minutes_);

        std::string name = toLowerCopy(storeComponent(request.site, "site")) + "_" +
                           storeComponent(request.task, "task") + "_" +
                           toString(request.phase) + "_" +
                           classification::formatCompactStamp(local);

        const std::string label_source = request.original_name.empty()
            ? request.caption
            : fs::path(request.original_name).stem().string();
        const auto label = sanitizeLabel(label_source, kMaxLabelLength);
        if (!label.empty() && label != "_") {
            name += "_" + label;
        }
        return name;
    }

    std::shared_ptr<std::mutex> StorageLocator::directoryMutex(const std::string& directory) {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto& slot = directory_mutexes_[directory];
        if (!slot) {
            slot = std::make_shared<std::mutex>();
        }
        return slot;
    }

    std::string StorageLocator::place(const PlacementRequest& request, const std::vector<unsigned char>& bytes) {
        const auto directory = directoryFor(request.captured_at, request.site, request.task, request.phase);
        const auto stem = baseFilename(request);

        auto extension = extensionOf(request.original_name);
        if (!isImageExtension(extension)) {
            extension = ".jpg";
        }
        const std::string photo_label = request.original_name.empty() ? stem + extension : request.original_name;

        auto mutex = directoryMutex(directory);
        std::lock_guard<std::mutex> lock(*mutex);

        std::string temporary;
        try {
            port_->createDirectories(directory);
            temporary = port_->writeTemporary(directory, bytes);

            for (int suffix = 0; suffix <= kMaxCollisionSuffix; ++suffix) {
                const std::string filename = suffix == 0
                    ? stem + extension
                    : stem + "-" + std::to_string(suffix) + extension;
                const std::string candidate = (fs::path(directory) / filename).string();

                if (port_->exists(candidate)) {
                    continue;
                }
                if (port_->publishIfAbsent(temporary, candidate)) {
                    LOG_DEBUG("Stored " + candidate);
                    return candidate;
                }
            }
        } catch (const std::exception& e) {
            if (!temporary.empty()) {
                port_->discard(temporary);
            }
            throw StorageFailure(photo_label, e.what());
        }

        port_->discard(temporary);
        throw StorageFailure(photo_label, "no free filename in " + directory);
    }

} // namespace photo_pairing::storage
