#pragma once

#include "../core/TempoContext.hpp"
#include "../core/WidthCalculator.hpp"
#include "GestureTypes.hpp"

namespace timegrid {

/**
 * @brief State machine for one non-destructive trim of a track block
 *
 * Idle -> start(edge) -> Active -> update()* -> commit() -> Idle
 *
 * Right edge: only the width changes. Position and content offset stay at
 * their anchors.
 *
 * Left edge: the block's right edge stays at anchorPosition + anchorWidth.
 * The content is shifted opposite to the container so the trimmed
 * waveform/notes stay where they were on screen:
 *     contentOffset = anchorContentOffset - (position - anchorPosition)
 *
 * The content offset is captured at start() exactly as the caller renders it.
 * Recomputing it from trim state mid-gesture would apply a partially rendered
 * edit twice.
 *
 * Width never drops below minWidthSubdivisions grid subdivisions.
 */
class ResizeSession {
  public:
    /**
     * @param trackId Track being resized
     * @param minWidthSubdivisions Width floor in grid units (>= 1)
     */
    explicit ResizeSession(TrackId trackId, int minWidthSubdivisions = 1);

    /**
     * @brief Anchor the resize
     * @param edge Handle being dragged, fixed for the session
     * @param pointerX Pointer x in pixels, scroll offset included
     * @param visiblePosition Current block x in pixels
     * @param visibleWidth Current block width in pixels
     * @param contentOffset Current content shift in pixels, as rendered
     */
    void start(ResizeEdge edge, double pointerX, double visiblePosition, double visibleWidth,
               double contentOffset);

    /** Anchor the resize at a computed layout */
    void start(ResizeEdge edge, double pointerX, const TrackLayout& layout);

    /**
     * @brief Follow the pointer
     * @param pointerX Current pointer x, scroll offset included
     * @param tempo Current tempo/zoom, sets the grid unit
     */
    ResizeUpdate update(double pointerX, const TempoContext& tempo);

    /**
     * @brief Finish the resize
     * @return Edge and pixel delta (position delta for left, width delta for right)
     */
    ResizeResult commit();

    bool isActive() const {
        return active_;
    }
    TrackId getTrackId() const {
        return trackId_;
    }
    int getMinWidthSubdivisions() const {
        return minWidthSubdivisions_;
    }

    ResizeEdge getEdge() const;
    double getAnchorPosition() const;
    double getAnchorWidth() const;
    double getAnchorContentOffset() const;

    /** Latest geometry (the anchors until the first update) */
    ResizeUpdate getCurrent() const;

  private:
    void requireActive(const char* operation) const;

    TrackId trackId_;
    int minWidthSubdivisions_;

    bool active_ = false;
    ResizeEdge edge_ = ResizeEdge::Right;
    double anchorPointerX_ = 0.0;
    double anchorPosition_ = 0.0;
    double anchorWidth_ = 0.0;
    double anchorContentOffset_ = 0.0;

    ResizeUpdate current_;
};

}  // namespace timegrid
