#pragma once

#include "photo_pairing/types.hpp"
#include <string>
#include <vector>

namespace photo_pairing::catalog {

    /**
     * @brief One report request: a (site, task) group over a month range
     *
     * to_month empty means the single month from_month. Months are "YYYY-MM"
     * and the range is inclusive.
     */
    struct GroupSelector {
        std::string site;
        std::string task;
        std::string from_month;
        std::string to_month;

        std::string label() const;
    };

    /// Photos of one group, each side sorted by path.
    struct PhotoGroup {
        std::vector<Photo> before;
        std::vector<Photo> after;

        bool empty() const { return before.empty() && after.empty(); }
    };

    /**
     * @brief Read-only view of the photo store
     */
    class PhotoCatalog {
    public:
        PhotoCatalog(std::string save_root, int utc_offset_minutes);

        /// "YYYY-MM" directories under the store root, sorted.
        std::vector<std::string> listMonths() const;

        std::vector<std::string> listSites(const std::string& month) const;
        std::vector<std::string> listTasks(const std::string& month, const std::string& site) const;

        /**
         * @brief Image files directly inside @p directory, sorted by path
         *
         * Hidden and temporary files are skipped. A missing directory yields
         * an empty list.
         */
        std::vector<std::string> listImages(const std::string& directory) const;

        /**
         * @brief Load every before/after photo of the selected group
         * @throws std::invalid_argument for malformed month keys or an empty site/task
         */
        PhotoGroup collectGroup(const GroupSelector& selector) const;

        /// Build a Photo record for a stored file.
        Photo describe(const std::string& path, const std::string& site, const std::string& task,
                       const std::string& month, Phase phase) const;

        const std::string& root() const { return save_root_; }

        static bool isMonthName(const std::string& name);

    private:
        std::vector<std::string> listDirectories(const std::string& directory) const;

        std::string save_root_;
        int utc_offset_minutes_;
    };

} // namespace photo_pairing::catalog
