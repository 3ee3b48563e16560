#include "SiteRegistry.hpp"
#include "photo_pairing/logging.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>

namespace photo_pairing::classification {

namespace {

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string toUpperCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

}

    SiteRegistry::SiteRegistry() {
        for (const char* name : {"ALPHA", "BRAVO", "CHARLIE", "DELTA", "ECHO"}) {
            const std::string site(name);
            addSite(site, toLowerCopy(site.substr(0, 1)));
        }
    }

    SiteRegistry SiteRegistry::empty() {
        return SiteRegistry(EmptyTag{});
    }

    bool SiteRegistry::addSite(const std::string& name, const std::string& shortcut) {
        const auto site = toUpperCopy(name);
        if (site.empty()) {
            return false;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (sites_.count(site) > 0) {
            LOG_DEBUG("Site exists: " + site);
            return false;
        }

        auto& aliases = sites_[site];
        aliases.insert(toLowerCopy(site));
        if (!shortcut.empty()) {
            aliases.insert(toLowerCopy(shortcut));
        }
        for (const auto& alias : aliases) {
            aliases_[alias] = site;
        }
        return true;
    }

    size_t SiteRegistry::addSites(const std::vector<std::string>& entries) {
        size_t added = 0;
        for (const auto& entry : entries) {
            const auto colon = entry.find(':');
            const auto name = entry.substr(0, colon);
            const auto shortcut = colon == std::string::npos ? std::string() : entry.substr(colon + 1);
            if (name.empty() || (colon != std::string::npos && shortcut.empty())) {
                throw std::invalid_argument("site entry '" + entry + "' must be NAME or NAME:shortcut");
            }
            if (addSite(name, shortcut)) {
                LOG_INFO("Registered site " + toUpperCopy(name) +
                         (shortcut.empty() ? std::string() : " (alias " + toLowerCopy(shortcut) + ")"));
                ++added;
            }
        }
        return added;
    }

    std::optional<std::string> SiteRegistry::resolveAlias(const std::string& alias) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = aliases_.find(toLowerCopy(alias));
        if (it == aliases_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<std::string> SiteRegistry::detectSite(const std::string& text) const {
        static const std::regex separators(R"([\s,;/\-_.]+)");
        static const std::regex zone(R"(\bzone\s*([a-z])\b)");

        const auto lowered = toLowerCopy(text);
        std::sregex_token_iterator it(lowered.begin(), lowered.end(), separators, -1);
        for (std::sregex_token_iterator end; it != end; ++it) {
            const std::string token = *it;
            if (token.empty()) {
                continue;
            }
            if (auto site = resolveAlias(token)) {
                return site;
            }
        }

        std::smatch match;
        if (std::regex_search(lowered, match, zone)) {
            return resolveAlias(match[1].str());
        }
        return std::nullopt;
    }

    std::string SiteRegistry::siteOrUnspecified(const std::string& text) const {
        const auto site = detectSite(text);
        return site ? *site : std::string(kUnspecifiedSite);
    }

    std::vector<std::string> SiteRegistry::sites() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> names;
        names.reserve(sites_.size());
        for (const auto& entry : sites_) {
            names.push_back(entry.first);
        }
        return names;
    }

    std::string SiteRegistry::inferTask(const std::string& caption) {
        const auto text = toLowerCopy(caption);
        for (const char* keyword : {"longkang", "parit", "drain"}) {
            if (text.find(keyword) != std::string::npos) {
                return kTaskDrainageCleaning;
            }
        }
        return kTaskGrassCutting;
    }

} // namespace photo_pairing::classification
