#pragma once

#include "../gesture/GestureTypes.hpp"
#include "TempoContext.hpp"
#include "TrackGeometry.hpp"

namespace timegrid {

/**
 * @brief Applies committed gesture results to owner-held track state
 *
 * Trim ratio is the source of truth: a resize delta in pixels is turned into
 * content ticks through the same ratio WidthCalculator uses to derive the
 * visible width, so re-deriving geometry after the edit lands exactly where
 * the gesture left the block.
 *
 * Every method returns false (and leaves the track untouched) when the
 * result would not change anything, so callers can skip persistence and
 * history entries for no-op gestures.
 */
class TrackOperations {
  public:
    static constexpr double MIN_TRIM_LENGTH_TICKS = 1.0;

    /**
     * @brief Move a track to a committed drag position
     * @return true if the position changed
     */
    static bool moveTrack(TrackGeometry& track, const DragResult& result);

    /**
     * @brief Apply a committed resize as a trim change
     *
     * Left edge: trimStart moves by the delta (clamped to [0, trimEnd - MIN])
     * and the track start moves on the timeline by the amount actually applied.
     * Right edge: trimEnd moves by the delta (clamped to
     * [trimStart + MIN, originalDuration]).
     *
     * @return true if the trim changed
     */
    static bool applyResize(TrackGeometry& track, const ResizeResult& result,
                            const TempoContext& tempo);

    /**
     * @brief Convert a pixel delta on the visible block into content ticks
     * @return 0 when the content has no width yet
     */
    static double pixelDeltaToContentTicks(const TrackGeometry& track, double deltaPixels,
                                           const TempoContext& tempo);

    /**
     * @brief Show the full content again
     * @return true if there was a trim to clear
     */
    static bool resetTrim(TrackGeometry& track);

  private:
    static void requireMatchingTrack(const TrackGeometry& track, TrackId resultTrackId);
};

}  // namespace timegrid
