#include "DragSession.hpp"

#include <juce_core/juce_core.h>

#include <stdexcept>
#include <string>

#include "../core/GridSnapper.hpp"
#include "../core/TimeMath.hpp"

namespace timegrid {

DragSession::DragSession(TrackId trackId, double laneHeight)
    : trackId_(trackId), laneHeight_(laneHeight) {
    if (!(laneHeight_ > 0.0))
        throw std::invalid_argument("DragSession: laneHeight must be positive, got " +
                                    std::to_string(laneHeight_));
}

void DragSession::start(const PixelPoint& pointer, const PixelPoint& trackPosition) {
    if (active_)
        throw std::logic_error("DragSession::start() - drag already active on track " +
                               std::to_string(trackId_));

    anchorPointer_ = pointer;
    anchorTrackPosition_ = trackPosition;
    currentPosition_ = trackPosition;
    anchorTicks_.reset();
    anchorTempo_.reset();
    updated_ = false;
    active_ = true;

    DBG("DragSession: start track=" << trackId_ << " at (" << trackPosition.x << ", "
                                    << trackPosition.y << ")");
}

void DragSession::start(const PixelPoint& pointer, const TrackGeometry& track,
                        const TempoContext& tempo) {
    PixelPoint trackPosition{TimeMath::ticksToPixels(track.positionTicks.x, tempo),
                             track.positionTicks.y};
    start(pointer, trackPosition);
    anchorTicks_ = track.positionTicks;
    anchorTempo_ = tempo;
}

PixelPoint DragSession::update(const PixelPoint& pointer, const TempoContext& tempo) {
    requireActive("update");

    PixelPoint raw = anchorTrackPosition_ + (pointer - anchorPointer_);

    // Grid rounding with a floor of zero on both axes
    currentPosition_.x = GridSnapper::snap(raw.x, GridSnapper::subdivisionWidth(tempo));
    currentPosition_.y = GridSnapper::snap(raw.y, laneHeight_);
    updated_ = true;
    return currentPosition_;
}

DragResult DragSession::commit(const TempoContext& tempo) {
    requireActive("commit");

    TickPosition startTicks;
    if (anchorTicks_.has_value()) {
        startTicks = *anchorTicks_;
    } else {
        startTicks.x = TimeMath::pixelsToTicks(anchorTrackPosition_.x, tempo);
        startTicks.y = anchorTrackPosition_.y;
    }

    DragResult result;
    result.trackId = trackId_;

    // Anchor pixels only mean the starting ticks at the zoom they were computed with
    bool sameScale = !anchorTempo_.has_value() || *anchorTempo_ == tempo;

    if (!updated_ || (currentPosition_ == anchorTrackPosition_ && sameScale)) {
        // Released where it started: report the starting ticks untouched
        result.positionTicks = startTicks;
    } else {
        result.positionTicks.x = TimeMath::pixelsToTicks(currentPosition_.x, tempo);
        result.positionTicks.y = currentPosition_.y;
    }

    result.laneIndex = result.positionTicks.getLaneIndex(laneHeight_);
    result.moved = result.positionTicks != startTicks;
    active_ = false;

    DBG("DragSession: commit track=" << trackId_ << " ticks=" << result.positionTicks.x
                                     << " lane=" << result.laneIndex
                                     << (result.moved ? "" : " (unchanged)"));
    return result;
}

PixelPoint DragSession::getCurrentPosition() const {
    requireActive("getCurrentPosition");
    return currentPosition_;
}

void DragSession::requireActive(const char* operation) const {
    if (!active_)
        throw std::logic_error(std::string("DragSession::") + operation +
                               "() called without an active drag on track " +
                               std::to_string(trackId_));
}

}  // namespace timegrid
