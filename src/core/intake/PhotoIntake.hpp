#pragma once

#include "src/core/classification/PhaseClassifier.hpp"
#include "src/core/classification/SiteRegistry.hpp"
#include "src/core/storage/StorageLocator.hpp"
#include "photo_pairing/database/DatabaseManager.hpp"
#include "photo_pairing/types.hpp"
#include <memory>
#include <string>

namespace photo_pairing::intake {

    enum class PlacementStatus {
        STORED,                ///< Written to the store
        REJECTED,              ///< Mid-day gap or unusable site/task name; nothing written
        FAILED                 ///< StorageFailure; nothing written, safe to retry
    };

    inline std::string toString(PlacementStatus status) {
        switch (status) {
            case PlacementStatus::STORED: return "stored";
            case PlacementStatus::REJECTED: return "rejected";
            case PlacementStatus::FAILED: return "failed";
            default: return "unknown";
        }
    }

    /**
     * @brief Result handed back to the upload adapter
     */
    struct PlacementOutcome {
        PlacementStatus status = PlacementStatus::REJECTED;
        Phase phase = Phase::REJECTED;
        std::string site;
        std::string task;
        std::string stored_path;   ///< Set when STORED
        std::string reason;        ///< Set when REJECTED or FAILED

        bool stored() const { return status == PlacementStatus::STORED; }
    };

    /**
     * @brief Upload tuple -> classified, stored photo
     *
     * An empty site is detected from the caption (UNSPECIFIED when nothing
     * matches); an empty task is inferred from caption keywords. Each
     * attempt is recorded in the database when one is attached.
     *
     * The outcome carries site and task as they are named in the store
     * ("North Park" comes back as "North_Park"), so they can be handed
     * straight to PhotoCatalog::collectGroup.
     */
    class PhotoIntake {
    public:
        PhotoIntake(const classification::PhaseClassifier& classifier,
                    const classification::SiteRegistry& sites,
                    storage::StorageLocator& locator,
                    const database::DatabaseManager* database = nullptr);

        PlacementOutcome submit(const PhotoSubmission& submission);

    private:
        std::string rejectionReason(std::time_t captured_at) const;
        void record(const PhotoSubmission& submission, const PlacementOutcome& outcome) const;

        const classification::PhaseClassifier& classifier_;
        const classification::SiteRegistry& sites_;
        storage::StorageLocator& locator_;
        const database::DatabaseManager* database_;
    };

} // namespace photo_pairing::intake
