#include <gtest/gtest.h>
#include "src/core/classification/CaptureTime.hpp"
#include "src/core/classification/PhaseClassifier.hpp"
#include "photo_pairing/errors.hpp"

using photo_pairing::ClassificationParams;
using photo_pairing::ConfigurationError;
using photo_pairing::Phase;
using photo_pairing::classification::LocalDateTime;
using photo_pairing::classification::PhaseClassifier;
using photo_pairing::classification::fromLocalDateTime;

namespace {

std::time_t at(int hour, int minute = 0, int second = 0, int offset_minutes = 0) {
    LocalDateTime local;
    local.year = 2024;
    local.month = 5;
    local.day = 3;
    local.hour = hour;
    local.minute = minute;
    local.second = second;
    return fromLocalDateTime(local, offset_minutes);
}

ClassificationParams window(int before, int after, int offset = 0) {
    ClassificationParams params;
    params.before_hour = before;
    params.after_hour = after;
    params.utc_offset_minutes = offset;
    return params;
}

} // namespace

TEST(PhaseClassifier, MorningAfternoonAndMidday) {
    const PhaseClassifier classifier(window(12, 15));
    EXPECT_EQ(classifier.classify(at(9)), Phase::BEFORE);
    EXPECT_EQ(classifier.classify(at(16)), Phase::AFTER);
    EXPECT_EQ(classifier.classify(at(13)), Phase::REJECTED);
}

TEST(PhaseClassifier, WindowBoundaries) {
    const PhaseClassifier classifier(window(12, 15));
    EXPECT_EQ(classifier.classify(at(0, 0, 0)), Phase::BEFORE);
    EXPECT_EQ(classifier.classify(at(11, 59, 59)), Phase::BEFORE);
    EXPECT_EQ(classifier.classify(at(12, 0, 0)), Phase::REJECTED);
    EXPECT_EQ(classifier.classify(at(14, 59, 59)), Phase::REJECTED);
    EXPECT_EQ(classifier.classify(at(15, 0, 0)), Phase::AFTER);
    EXPECT_EQ(classifier.classify(at(23, 59, 59)), Phase::AFTER);
}

TEST(PhaseClassifier, PhasesPartitionTheDay) {
    const PhaseClassifier classifier(window(10, 17));
    int before = 0, rejected = 0, after = 0;
    for (int hour = 0; hour < 24; ++hour) {
        const Phase expected = hour < 10 ? Phase::BEFORE : (hour >= 17 ? Phase::AFTER : Phase::REJECTED);
        EXPECT_EQ(classifier.classifyHour(hour), expected) << "hour " << hour;
        for (int minute = 0; minute < 60; minute += 15) {
            EXPECT_EQ(classifier.classify(at(hour, minute)), expected) << hour << ":" << minute;
        }
        switch (expected) {
            case Phase::BEFORE: ++before; break;
            case Phase::REJECTED: ++rejected; break;
            case Phase::AFTER: ++after; break;
        }
    }
    EXPECT_EQ(before, 10);
    EXPECT_EQ(rejected, 7);
    EXPECT_EQ(after, 7);
}

TEST(PhaseClassifier, UsesConfiguredOffsetOnly) {
    const PhaseClassifier utc(window(12, 15, 0));
    const PhaseClassifier malaysia(window(12, 15, 480));

    // 01:00 UTC is 09:00 at +08:00; 08:00 UTC is 16:00
    const auto one_utc = at(1);
    const auto eight_utc = at(8);
    EXPECT_EQ(utc.classify(one_utc), Phase::BEFORE);
    EXPECT_EQ(malaysia.classify(one_utc), Phase::BEFORE);
    EXPECT_EQ(utc.classify(eight_utc), Phase::BEFORE);
    EXPECT_EQ(malaysia.classify(eight_utc), Phase::AFTER);
    EXPECT_EQ(malaysia.classify(at(16, 0, 0, 480)), Phase::AFTER);
}

TEST(PhaseClassifier, IsDeterministic) {
    const PhaseClassifier classifier(window(12, 15));
    for (std::time_t t = at(0); t < at(23, 59, 59); t += 977) {
        EXPECT_EQ(classifier.classify(t), classifier.classify(t));
    }
}

TEST(PhaseClassifier, RejectsInvalidWindows) {
    EXPECT_THROW(PhaseClassifier(window(15, 12)), ConfigurationError);
    EXPECT_THROW(PhaseClassifier(window(12, 12)), ConfigurationError);
    EXPECT_THROW(PhaseClassifier(window(-1, 12)), ConfigurationError);
    EXPECT_THROW(PhaseClassifier(window(12, 24)), ConfigurationError);
}

TEST(PhaseClassifier, CaptionHintsAreOptIn) {
    auto params = window(12, 15);
    const PhaseClassifier plain(params);
    EXPECT_EQ(plain.classify(at(16), "gambar sebelum kerja"), Phase::AFTER);
    EXPECT_EQ(plain.classify(at(13), "selepas"), Phase::REJECTED);

    params.caption_hints = true;
    const PhaseClassifier hinted(params);
    EXPECT_EQ(hinted.classify(at(16), "gambar sebelum kerja"), Phase::BEFORE);
    EXPECT_EQ(hinted.classify(at(13), "Selepas potong rumput"), Phase::AFTER);
    EXPECT_EQ(hinted.classify(at(13), "no hint here"), Phase::REJECTED);
}

TEST(PhaseClassifier, CaptionWords) {
    EXPECT_EQ(PhaseClassifier::phaseFromCaption("SBLM"), Phase::BEFORE);
    EXPECT_EQ(PhaseClassifier::phaseFromCaption("after cleaning"), Phase::AFTER);
    EXPECT_EQ(PhaseClassifier::phaseFromCaption("before and after"), Phase::BEFORE);
    EXPECT_FALSE(PhaseClassifier::phaseFromCaption("zone b").has_value());
}
