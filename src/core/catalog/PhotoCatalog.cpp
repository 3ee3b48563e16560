#include "PhotoCatalog.hpp"
#include "src/core/classification/CaptureTime.hpp"
#include "src/core/storage/StorageLocator.hpp"
#include "photo_pairing/logging.hpp"
#include <algorithm>
#include <filesystem>
#include <regex>
#include <stdexcept>

namespace fs = std::filesystem;

namespace photo_pairing::catalog {

namespace {

// Capture stamp embedded by StorageLocator: ..._YYYYMMDD_HHMMSS...
std::optional<classification::LocalDateTime> stampFromFilename(const std::string& filename) {
    static const std::regex pattern(R"((\d{4})(\d{2})(\d{2})_(\d{2})(\d{2})(\d{2}))");
    std::smatch match;
    if (!std::regex_search(filename, match, pattern)) {
        return std::nullopt;
    }
    const std::string text = match[1].str() + "-" + match[2].str() + "-" + match[3].str() + " " +
                             match[4].str() + ":" + match[5].str() + ":" + match[6].str();
    return classification::parseLocalDateTime(text);
}

}

    std::string GroupSelector::label() const {
        std::string range = from_month;
        if (!to_month.empty() && to_month != from_month) {
            range += ".." + to_month;
        }
        return site + "/" + task + " " + range;
    }

    PhotoCatalog::PhotoCatalog(std::string save_root, int utc_offset_minutes)
        : save_root_(std::move(save_root)),
          utc_offset_minutes_(utc_offset_minutes) {}

    bool PhotoCatalog::isMonthName(const std::string& name) {
        static const std::regex pattern(R"(^\d{4}-(0[1-9]|1[0-2])$)");
        return std::regex_match(name, pattern);
    }

    std::vector<std::string> PhotoCatalog::listDirectories(const std::string& directory) const {
        std::vector<std::string> names;
        std::error_code ec;
        if (!fs::is_directory(directory, ec)) {
            return names;
        }
        for (const auto& entry : fs::directory_iterator(directory, ec)) {
            const auto name = entry.path().filename().string();
            if (!name.empty() && name[0] != '.' && entry.is_directory(ec)) {
                names.push_back(name);
            }
        }
        if (ec) {
            LOG_WARNING("Error listing " + directory + ": " + ec.message());
        }
        std::sort(names.begin(), names.end());
        return names;
    }

    std::vector<std::string> PhotoCatalog::listMonths() const {
        auto names = listDirectories(save_root_);
        names.erase(std::remove_if(names.begin(), names.end(),
                                   [](const std::string& name) { return !isMonthName(name); }),
                    names.end());
        return names;
    }

    std::vector<std::string> PhotoCatalog::listSites(const std::string& month) const {
        return listDirectories((fs::path(save_root_) / month).string());
    }

    std::vector<std::string> PhotoCatalog::listTasks(const std::string& month, const std::string& site) const {
        return listDirectories((fs::path(save_root_) / month / site).string());
    }

    std::vector<std::string> PhotoCatalog::listImages(const std::string& directory) const {
        std::vector<std::string> paths;
        std::error_code ec;
        if (!fs::is_directory(directory, ec)) {
            return paths;
        }
        for (const auto& entry : fs::directory_iterator(directory, ec)) {
            const auto name = entry.path().filename().string();
            if (name.empty() || name[0] == '.' || name[0] == '~') {
                continue;
            }
            if (!entry.is_regular_file(ec)) {
                continue;
            }
            if (storage::isImageExtension(entry.path().extension().string())) {
                paths.push_back(entry.path().string());
            }
        }
        if (ec) {
            LOG_WARNING("Error listing " + directory + ": " + ec.message());
        }
        std::sort(paths.begin(), paths.end());
        return paths;
    }

    Photo PhotoCatalog::describe(const std::string& path, const std::string& site, const std::string& task,
                                 const std::string& month, Phase phase) const {
        Photo photo;
        photo.identity.path = path;
        photo.site = site;
        photo.task = task;
        photo.month = month;
        photo.phase = phase;

        std::error_code ec;
        const auto size = fs::file_size(path, ec);
        if (!ec) {
            photo.identity.size = size;
        }
        const auto modified = fs::last_write_time(path, ec);
        if (!ec) {
            photo.identity.modified_token = static_cast<std::int64_t>(modified.time_since_epoch().count());
        }

        if (const auto stamp = stampFromFilename(fs::path(path).filename().string())) {
            photo.captured_at = classification::fromLocalDateTime(*stamp, utc_offset_minutes_);
        }
        return photo;
    }

    PhotoGroup PhotoCatalog::collectGroup(const GroupSelector& selector) const {
        if (selector.site.empty() || selector.task.empty()) {
            throw std::invalid_argument("group selector needs a site and a task");
        }
        if (!isMonthName(selector.from_month)) {
            throw std::invalid_argument("month must be YYYY-MM, got '" + selector.from_month + "'");
        }
        const std::string last = selector.to_month.empty() ? selector.from_month : selector.to_month;
        if (!isMonthName(last)) {
            throw std::invalid_argument("month must be YYYY-MM, got '" + last + "'");
        }
        if (last < selector.from_month) {
            throw std::invalid_argument("month range is reversed: " + selector.from_month + " > " + last);
        }

        const std::string site = storage::storeComponent(selector.site, "site");
        const std::string task = storage::storeComponent(selector.task, "task");

        PhotoGroup group;
        for (const auto& month : listMonths()) {
            if (month < selector.from_month || month > last) {
                continue;
            }
            const fs::path base = fs::path(save_root_) / month / site / task;
            for (const auto& path : listImages((base / toString(Phase::BEFORE)).string())) {
                group.before.push_back(describe(path, site, task, month, Phase::BEFORE));
            }
            for (const auto& path : listImages((base / toString(Phase::AFTER)).string())) {
                group.after.push_back(describe(path, site, task, month, Phase::AFTER));
            }
        }

        auto byPath = [](const Photo& a, const Photo& b) { return a.identity.path < b.identity.path; };
        std::sort(group.before.begin(), group.before.end(), byPath);
        std::sort(group.after.begin(), group.after.end(), byPath);

        LOG_INFO("Collected " + selector.label() + ": " + std::to_string(group.before.size()) +
                 " before, " + std::to_string(group.after.size()) + " after");
        return group;
    }

} // namespace photo_pairing::catalog
