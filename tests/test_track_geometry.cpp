#include <catch2/catch_test_macros.hpp>

#include <string>

#include "timegrid/core/TrackGeometry.hpp"

using namespace timegrid;

TEST_CASE("TrackGeometry - track families", "[geometry]") {
    REQUIRE(getContentKind(TrackType::Audio) == ContentKind::Continuous);
    REQUIRE(getContentKind(TrackType::Sampler) == ContentKind::Continuous);
    REQUIRE(getContentKind(TrackType::Midi) == ContentKind::Discrete);
    REQUIRE(getContentKind(TrackType::Drum) == ContentKind::Discrete);

    REQUIRE(std::string(getTrackTypeName(TrackType::Midi)) == "MIDI");
    REQUIRE(std::string(getTrackTypeName(TrackType::Sampler)) == "Sampler");
}

TEST_CASE("TrackGeometry - default length before content loads", "[geometry]") {
    REQUIRE(defaultDurationTicks(TimeSignature{4, 4}) == 7680.0);
    REQUIRE(defaultDurationTicks(TimeSignature{3, 4}, 2) == 2880.0);
}

TEST_CASE("TrackGeometry - lane index from y", "[geometry][lane]") {
    TickPosition position{0.0, 160.0};
    REQUIRE(position.getLaneIndex(80.0) == 2);
    REQUIRE(position.getLaneIndex(0.0) == 0);
}

TEST_CASE("TrackGeometry - trim state", "[geometry][trim]") {
    TrackGeometry track;
    track.originalDurationTicks = 1920.0;
    track.contentExtent = 2.0;

    REQUIRE(track.isContentLoaded());
    REQUIRE_FALSE(track.hasTrim());
    REQUIRE(track.getVisibleDurationTicks() == 1920.0);
    REQUIRE(track.hasValidTrim());

    track.trimStartTicks = 480.0;
    track.trimEndTicks = 1440.0;
    REQUIRE(track.hasTrim());
    REQUIRE(track.getVisibleDurationTicks() == 960.0);

    track.trimEndTicks = 2400.0;
    REQUIRE_FALSE(track.hasValidTrim());

    SECTION("Events define discrete extent") {
        std::vector<ContentEvent> events{{0.0, 240.0}, {1680.0, 480.0}, {960.0, 120.0}};
        REQUIRE(maxEventEndTicks(events) == 2160.0);
        REQUIRE(maxEventEndTicks({}) == 0.0);
    }
}
