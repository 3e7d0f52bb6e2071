#pragma once

#include <juce_core/juce_core.h>

#include <cmath>
#include <optional>
#include <vector>

#include "TempoContext.hpp"
#include "TypeIds.hpp"

namespace timegrid {

/**
 * @brief Track families shown on the arrangement surface
 */
enum class TrackType {
    Audio,    // Recorded/imported audio file
    Sampler,  // Single sample played back as-is
    Midi,     // Note events
    Drum      // Step pattern events
};

/**
 * @brief How a track's content extent is measured
 */
enum class ContentKind {
    Continuous,  // Extent is elapsed seconds
    Discrete     // Extent is the maximum event end offset in ticks
};

inline ContentKind getContentKind(TrackType type) {
    switch (type) {
        case TrackType::Audio:
        case TrackType::Sampler:
            return ContentKind::Continuous;
        case TrackType::Midi:
        case TrackType::Drum:
            return ContentKind::Discrete;
    }
    return ContentKind::Continuous;
}

inline const char* getTrackTypeName(TrackType type) {
    switch (type) {
        case TrackType::Audio:
            return "Audio";
        case TrackType::Sampler:
            return "Sampler";
        case TrackType::Midi:
            return "MIDI";
        case TrackType::Drum:
            return "Drum";
    }
    return "Unknown";
}

/**
 * @brief Track placement: x in ticks, y in pixels (lane index * lane height)
 */
struct TickPosition {
    double x = 0.0;
    double y = 0.0;

    int getLaneIndex(double laneHeight) const {
        if (laneHeight <= 0.0)
            return 0;
        return static_cast<int>(std::round(y / laneHeight));
    }

    bool operator==(const TickPosition& other) const {
        return x == other.x && y == other.y;
    }
    bool operator!=(const TickPosition& other) const {
        return !(*this == other);
    }
};

/**
 * @brief One event of discrete content (note, drum hit)
 */
struct ContentEvent {
    double startTicks = 0.0;
    double durationTicks = 0.0;

    double getEndTicks() const {
        return startTicks + durationTicks;
    }
};

/**
 * @brief Largest event end offset, or 0 for no events
 */
inline double maxEventEndTicks(const std::vector<ContentEvent>& events) {
    double maxEnd = 0.0;
    for (const auto& event : events)
        maxEnd = juce::jmax(maxEnd, event.getEndTicks());
    return maxEnd;
}

/**
 * @brief Length of a freshly created track before its content is known
 */
inline double defaultDurationTicks(const TimeSignature& signature, int bars = 4) {
    return static_cast<double>(bars) * signature.beatsPerMeasure * TICKS_PER_BEAT;
}

/**
 * @brief Per-track state read by the width calculator and the gesture sessions
 *
 * Owned by the application. Sessions read a snapshot at start and never write
 * to it; committed gesture results are applied through TrackOperations.
 */
struct TrackGeometry {
    TrackId id = INVALID_TRACK_ID;
    TrackType type = TrackType::Audio;

    TickPosition positionTicks;

    // Visible window into the full content, relative to the content origin
    double trimStartTicks = 0.0;
    std::optional<double> trimEndTicks;  // nullopt = up to the end of content

    // Full untrimmed length, fixed when content loads
    double originalDurationTicks = 0.0;

    // Seconds for continuous media, ticks for discrete content
    double contentExtent = 0.0;

    ContentKind getContentKind() const {
        return timegrid::getContentKind(type);
    }

    /** True when trim bounds describe a window other than "everything" */
    bool hasTrim() const {
        return trimStartTicks != 0.0 || trimEndTicks.has_value();
    }

    /** Trim end with the "absent means full content" rule applied */
    double getEffectiveTrimEndTicks() const {
        return trimEndTicks.value_or(originalDurationTicks);
    }

    double getVisibleDurationTicks() const {
        return juce::jmax(0.0, getEffectiveTrimEndTicks() - trimStartTicks);
    }

    bool isContentLoaded() const {
        return originalDurationTicks > 0.0 && contentExtent > 0.0;
    }

    /** 0 <= trimStart < trimEnd <= originalDuration */
    bool hasValidTrim() const {
        double end = getEffectiveTrimEndTicks();
        return trimStartTicks >= 0.0 && trimStartTicks < end && end <= originalDurationTicks;
    }
};

}  // namespace timegrid
