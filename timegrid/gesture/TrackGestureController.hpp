#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "../core/TempoContext.hpp"
#include "../core/TrackGeometry.hpp"
#include "DragSession.hpp"
#include "GestureTypes.hpp"
#include "ResizeSession.hpp"

namespace timegrid {

/**
 * @brief Listener interface for gesture progress and results
 *
 * Live updates arrive on every pointer move; committed results only when
 * they actually change something.
 */
class TrackGestureListener {
  public:
    virtual ~TrackGestureListener() = default;

    virtual void trackDragUpdated(TrackId trackId, const PixelPoint& position) {
        juce::ignoreUnused(trackId, position);
    }

    /** Only sent when the track ended up somewhere else */
    virtual void trackMoveCommitted(const DragResult& result) = 0;

    virtual void trackResizeUpdated(TrackId trackId, const ResizeUpdate& update) {
        juce::ignoreUnused(trackId, update);
    }

    /** Only sent for a non-zero delta */
    virtual void trackResizeCommitted(const ResizeResult& result) = 0;

    /** A gesture was dropped without commit (focus loss, track removed) */
    virtual void trackGestureDiscarded(TrackId trackId) {
        juce::ignoreUnused(trackId);
    }
};

/**
 * @brief Routes pointer input for all tracks to per-track gesture sessions
 *
 * Each track may have one active drag and, independently, one active resize.
 * Sessions exist only between begin and end/discard, so nothing lingers
 * between gestures. Sessions of different tracks share no state.
 *
 * Beginning a second gesture of the same kind on a track, or continuing one
 * that was never begun, throws std::logic_error.
 */
class TrackGestureController {
  public:
    /** Lane height and minimum width taken from Config */
    TrackGestureController();
    TrackGestureController(double laneHeight, int minWidthSubdivisions);
    ~TrackGestureController();

    // ========================================================================
    // Drag
    // ========================================================================

    void beginDrag(const TrackGeometry& track, const PixelPoint& pointer,
                   const TempoContext& tempo);
    PixelPoint dragTo(TrackId trackId, const PixelPoint& pointer, const TempoContext& tempo);
    DragResult endDrag(TrackId trackId, const TempoContext& tempo);

    // ========================================================================
    // Resize
    // ========================================================================

    /**
     * @brief Begin a resize from the track's derived layout
     * @param widthOverride Visible width the owner is currently rendering, if any
     * @return false if the content is not loaded (zero width); no session starts
     */
    bool beginResize(const TrackGeometry& track, ResizeEdge edge, double pointerX,
                     const TempoContext& tempo,
                     std::optional<double> widthOverride = std::nullopt);

    /**
     * @brief Begin a resize from geometry exactly as currently rendered
     */
    void beginResize(TrackId trackId, ResizeEdge edge, double pointerX, double position,
                     double width, double contentOffset);

    ResizeUpdate resizeTo(TrackId trackId, double pointerX, const TempoContext& tempo);
    ResizeResult endResize(TrackId trackId);

    // ========================================================================
    // Lifetime
    // ========================================================================

    /** Drop any active gestures on a track without committing */
    void discardGestures(TrackId trackId);
    void discardAll();

    bool isDragging(TrackId trackId) const;
    bool isResizing(TrackId trackId) const;
    int getNumActiveGestures() const;

    double getLaneHeight() const {
        return laneHeight_;
    }
    int getMinWidthSubdivisions() const {
        return minWidthSubdivisions_;
    }

    // ========================================================================
    // Listener Management
    // ========================================================================

    void addListener(TrackGestureListener* listener);
    void removeListener(TrackGestureListener* listener);

  private:
    DragSession& getActiveDrag(TrackId trackId, const char* operation);
    ResizeSession& getActiveResize(TrackId trackId, const char* operation);

    void notifyListeners(const std::function<void(TrackGestureListener&)>& callback);

    double laneHeight_;
    int minWidthSubdivisions_;

    std::map<TrackId, std::unique_ptr<DragSession>> drags_;
    std::map<TrackId, std::unique_ptr<ResizeSession>> resizes_;

    std::vector<TrackGestureListener*> listeners_;
};

}  // namespace timegrid
