#pragma once

#include <optional>

#include "../core/TempoContext.hpp"
#include "../core/TrackGeometry.hpp"
#include "GestureTypes.hpp"

namespace timegrid {

/**
 * @brief State machine for one position drag of a track block
 *
 * Idle -> start() -> Active -> update()* -> commit() -> Idle
 *
 * The session holds only its anchors and the last snapped position. It never
 * touches the track it was started from; commit() returns the result and the
 * owner decides whether to persist it (DragResult::moved == false means the
 * block was released where it started).
 *
 * Calling update() or commit() while idle, or start() while active, throws
 * std::logic_error.
 */
class DragSession {
  public:
    /**
     * @param trackId Track being dragged
     * @param laneHeight Vertical grid unit in pixels (must be positive)
     */
    DragSession(TrackId trackId, double laneHeight);

    /**
     * @brief Anchor the drag at raw pixel positions
     * @param pointer Pointer position, scroll offset included
     * @param trackPosition Current block position in pixels
     */
    void start(const PixelPoint& pointer, const PixelPoint& trackPosition);

    /**
     * @brief Anchor the drag at a track snapshot
     *
     * Also remembers the snapshot's tick position and the context it was
     * converted with, so that releasing in place at the same zoom reports
     * exactly the starting ticks.
     */
    void start(const PixelPoint& pointer, const TrackGeometry& track, const TempoContext& tempo);

    /**
     * @brief Follow the pointer
     * @param pointer Current pointer position, scroll offset included
     * @param tempo Current tempo/zoom (may differ from the one at start)
     * @return Snapped block position in pixels, both axes >= 0
     */
    PixelPoint update(const PixelPoint& pointer, const TempoContext& tempo);

    /**
     * @brief Finish the drag
     *
     * Without any update() the starting position is returned as-is.
     * Otherwise the last snapped position is converted with this context.
     *
     * @param tempo Current tempo/zoom, used for the pixel to tick conversion
     * @return Final position with x in ticks
     */
    DragResult commit(const TempoContext& tempo);

    bool isActive() const {
        return active_;
    }
    TrackId getTrackId() const {
        return trackId_;
    }
    double getLaneHeight() const {
        return laneHeight_;
    }

    /** Last snapped position (the anchor until the first update) */
    PixelPoint getCurrentPosition() const;

  private:
    void requireActive(const char* operation) const;

    TrackId trackId_;
    double laneHeight_;

    bool active_ = false;
    bool updated_ = false;
    PixelPoint anchorPointer_;
    PixelPoint anchorTrackPosition_;
    PixelPoint currentPosition_;
    std::optional<TickPosition> anchorTicks_;
    std::optional<TempoContext> anchorTempo_;
};

}  // namespace timegrid
