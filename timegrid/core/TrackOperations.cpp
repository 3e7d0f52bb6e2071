#include "TrackOperations.hpp"

#include <juce_core/juce_core.h>

#include <stdexcept>
#include <string>

#include "TimeMath.hpp"
#include "WidthCalculator.hpp"

namespace timegrid {

// ============================================================================
// Position
// ============================================================================

bool TrackOperations::moveTrack(TrackGeometry& track, const DragResult& result) {
    requireMatchingTrack(track, result.trackId);

    if (!result.moved || track.positionTicks == result.positionTicks) {
        DBG("TrackOperations: no position change for track " << track.id << " - skipping");
        return false;
    }

    track.positionTicks.x = juce::jmax(0.0, result.positionTicks.x);
    track.positionTicks.y = juce::jmax(0.0, result.positionTicks.y);
    return true;
}

// ============================================================================
// Trim
// ============================================================================

double TrackOperations::pixelDeltaToContentTicks(const TrackGeometry& track, double deltaPixels,
                                                 const TempoContext& tempo) {
    double fullWidth = WidthCalculator::fullContentWidth(track, tempo);
    if (fullWidth <= 0.0 || track.originalDurationTicks <= 0.0)
        return 0.0;
    return deltaPixels / fullWidth * track.originalDurationTicks;
}

bool TrackOperations::applyResize(TrackGeometry& track, const ResizeResult& result,
                                  const TempoContext& tempo) {
    requireMatchingTrack(track, result.trackId);

    if (result.deltaPixels == 0.0)
        return false;

    double fullWidth = WidthCalculator::fullContentWidth(track, tempo);
    if (fullWidth <= 0.0 || track.originalDurationTicks <= 0.0) {
        DBG("TrackOperations: track " << track.id << " has no content yet - resize ignored");
        return false;
    }

    double deltaTicks = result.deltaPixels / fullWidth * track.originalDurationTicks;
    double start = track.trimStartTicks;
    double end = track.getEffectiveTrimEndTicks();

    if (result.edge == ResizeEdge::Left) {
        double maxStart = juce::jmax(0.0, end - MIN_TRIM_LENGTH_TICKS);
        double newStart = juce::jlimit(0.0, maxStart, start + deltaTicks);
        double appliedTicks = newStart - start;

        if (appliedTicks == 0.0)
            return false;

        if (newStart != start + deltaTicks)
            DBG("TrackOperations: trim start clamped to " << newStart << " on track " << track.id);

        // Move the block on the timeline by the pixel distance actually trimmed
        double appliedPixels = appliedTicks / track.originalDurationTicks * fullWidth;
        double positionDeltaTicks = TimeMath::pixelsToTicks(appliedPixels, tempo);

        track.trimStartTicks = newStart;
        track.positionTicks.x = juce::jmax(0.0, track.positionTicks.x + positionDeltaTicks);
        return true;
    }

    double minEnd = juce::jmin(start + MIN_TRIM_LENGTH_TICKS, track.originalDurationTicks);
    double newEnd = juce::jlimit(minEnd, track.originalDurationTicks, end + deltaTicks);

    if (newEnd == end)
        return false;

    if (newEnd != end + deltaTicks)
        DBG("TrackOperations: trim end clamped to " << newEnd << " on track " << track.id);

    track.trimEndTicks = newEnd;
    return true;
}

bool TrackOperations::resetTrim(TrackGeometry& track) {
    if (!track.hasTrim())
        return false;

    track.trimStartTicks = 0.0;
    track.trimEndTicks.reset();
    return true;
}

void TrackOperations::requireMatchingTrack(const TrackGeometry& track, TrackId resultTrackId) {
    if (resultTrackId != track.id)
        throw std::invalid_argument("TrackOperations: result for track " +
                                    std::to_string(resultTrackId) + " applied to track " +
                                    std::to_string(track.id));
}

}  // namespace timegrid
