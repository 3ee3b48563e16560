#include "PhotoIntake.hpp"
#include "src/core/classification/CaptureTime.hpp"
#include "photo_pairing/errors.hpp"
#include "photo_pairing/logging.hpp"
#include <stdexcept>

namespace photo_pairing::intake {

    PhotoIntake::PhotoIntake(const classification::PhaseClassifier& classifier,
                             const classification::SiteRegistry& sites,
                             storage::StorageLocator& locator,
                             const database::DatabaseManager* database)
        : classifier_(classifier),
          sites_(sites),
          locator_(locator),
          database_(database) {}

    std::string PhotoIntake::rejectionReason(std::time_t captured_at) const {
        const auto& params = classifier_.params();
        const auto local = classification::toLocalDateTime(captured_at, params.utc_offset_minutes);
        return "captured at " + classification::formatDisplay(local) + ", inside the " +
               std::to_string(params.before_hour) + ":00-" + std::to_string(params.after_hour) +
               ":00 gap between the before and after windows";
    }

    PlacementOutcome PhotoIntake::submit(const PhotoSubmission& submission) {
        PlacementOutcome outcome;

        if (!submission.site.empty()) {
            const auto resolved = sites_.resolveAlias(submission.site);
            outcome.site = resolved ? *resolved : submission.site;
        } else {
            outcome.site = sites_.siteOrUnspecified(submission.caption);
        }
        outcome.task = submission.task.empty()
            ? classification::SiteRegistry::inferTask(submission.caption)
            : submission.task;

        try {
            outcome.site = storage::storeComponent(outcome.site, "site");
            outcome.task = storage::storeComponent(outcome.task, "task");
        } catch (const std::invalid_argument& e) {
            outcome.status = PlacementStatus::REJECTED;
            outcome.reason = e.what();
            LOG_WARNING("Rejected " + (submission.original_name.empty() ? std::string("photo") : submission.original_name) +
                        ": " + outcome.reason);
            record(submission, outcome);
            return outcome;
        }

        outcome.phase = classifier_.classify(submission.captured_at, submission.caption);
        if (outcome.phase == Phase::REJECTED) {
            outcome.status = PlacementStatus::REJECTED;
            outcome.reason = rejectionReason(submission.captured_at);
            LOG_INFO("Rejected " + (submission.original_name.empty() ? std::string("photo") : submission.original_name) +
                     ": " + outcome.reason);
            record(submission, outcome);
            return outcome;
        }

        storage::PlacementRequest request;
        request.captured_at = submission.captured_at;
        request.site = outcome.site;
        request.task = outcome.task;
        request.phase = outcome.phase;
        request.original_name = submission.original_name;
        request.caption = submission.caption;

        try {
            outcome.stored_path = locator_.place(request, submission.bytes);
            outcome.status = PlacementStatus::STORED;
            LOG_INFO("Saved " + outcome.stored_path);
        } catch (const StorageFailure& e) {
            outcome.status = PlacementStatus::FAILED;
            outcome.reason = e.what();
            LOG_ERROR(outcome.reason);
        }

        record(submission, outcome);
        return outcome;
    }

    void PhotoIntake::record(const PhotoSubmission& submission, const PlacementOutcome& outcome) const {
        if (!database_ || !database_->isEnabled()) {
            return;
        }

        database::PlacementRecord entry;
        entry.status = toString(outcome.status);
        entry.stored_path = outcome.stored_path;
        entry.site = outcome.site;
        entry.task = outcome.task;
        entry.phase = photo_pairing::toString(outcome.phase);
        entry.captured_at = classification::formatDisplay(
            classification::toLocalDateTime(submission.captured_at, classifier_.params().utc_offset_minutes));
        entry.original_name = submission.original_name;
        entry.reason = outcome.reason;

        if (!database_->recordPlacement(entry)) {
            LOG_WARNING("Placement of " + (outcome.stored_path.empty() ? submission.original_name : outcome.stored_path) +
                        " was not recorded in the database");
        }
    }

} // namespace photo_pairing::intake
