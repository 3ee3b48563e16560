#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace photo_pairing {

    /**
     * @brief Invalid or missing configuration. Fatal at startup.
     */
    class ConfigurationError : public std::runtime_error {
    public:
        explicit ConfigurationError(const std::string& message)
            : std::runtime_error("Configuration error: " + message) {}
    };

    /**
     * @brief A photo could not be decoded. The photo is excluded from matching.
     */
    class UnreadableImage : public std::runtime_error {
    public:
        UnreadableImage(std::string source, const std::string& reason)
            : std::runtime_error("Unreadable image " + source + ": " + reason),
              source_(std::move(source)) {}

        const std::string& source() const { return source_; }

    private:
        std::string source_;
    };

    /**
     * @brief A placement into the photo store did not complete.
     *
     * Nothing is left behind in the store when this is thrown, so the
     * placement can be retried.
     */
    class StorageFailure : public std::runtime_error {
    public:
        StorageFailure(std::string photo, const std::string& reason)
            : std::runtime_error("Storage failure for " + photo + ": " + reason),
              photo_(std::move(photo)) {}

        const std::string& photo() const { return photo_; }

    private:
        std::string photo_;
    };

} // namespace photo_pairing
