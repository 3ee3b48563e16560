#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace photo_pairing::classification {

    inline constexpr const char* kUnspecifiedSite = "UNSPECIFIED";
    inline constexpr const char* kTaskGrassCutting = "grass_cutting";
    inline constexpr const char* kTaskDrainageCleaning = "drainage_cleaning";

    /**
     * @brief Known sites and their aliases, used to label uploads
     *
     * Site names are upper case; aliases are lower case. The default
     * registry knows ALPHA..ECHO with their name and first letter.
     * Thread-safe.
     */
    class SiteRegistry {
    public:
        SiteRegistry();

        static SiteRegistry empty();

        /**
         * @brief Register a site with its own lower-case name and an optional shortcut
         * @return false if the site already exists (nothing changes)
         */
        bool addSite(const std::string& name, const std::string& shortcut = "");

        /**
         * @brief Register configured sites, each "NAME" or "NAME:shortcut"
         * @return number of sites that were new
         * @throws std::invalid_argument for an entry with an empty name or shortcut
         */
        size_t addSites(const std::vector<std::string>& entries);

        /// Exact alias lookup (case-insensitive).
        std::optional<std::string> resolveAlias(const std::string& alias) const;

        /**
         * @brief Find a site mentioned in free text
         *
         * Tries each token (split on whitespace and , ; / - _ .) as an alias,
         * then a "zone <letter>" phrase.
         */
        std::optional<std::string> detectSite(const std::string& text) const;

        /// detectSite() or UNSPECIFIED.
        std::string siteOrUnspecified(const std::string& text) const;

        std::vector<std::string> sites() const;

        /// drainage_cleaning if the caption mentions a drain, else grass_cutting.
        static std::string inferTask(const std::string& caption);

    private:
        struct EmptyTag {};
        explicit SiteRegistry(EmptyTag) {}

        mutable std::mutex mutex_;
        std::map<std::string, std::set<std::string>> sites_;
        std::map<std::string, std::string> aliases_;
    };

} // namespace photo_pairing::classification
