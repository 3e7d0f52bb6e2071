#include "TrackGestureController.hpp"

#include <juce_core/juce_core.h>

#include <algorithm>
#include <stdexcept>
#include <string>

#include "../core/Config.hpp"
#include "../core/WidthCalculator.hpp"

namespace timegrid {

TrackGestureController::TrackGestureController()
    : TrackGestureController(Config::getInstance().getLaneHeight(),
                             Config::getInstance().getMinTrackWidthSubdivisions()) {}

TrackGestureController::TrackGestureController(double laneHeight, int minWidthSubdivisions)
    : laneHeight_(laneHeight), minWidthSubdivisions_(minWidthSubdivisions) {
    if (!(laneHeight_ > 0.0))
        throw std::invalid_argument("TrackGestureController: laneHeight must be positive");
    if (minWidthSubdivisions_ < 1)
        throw std::invalid_argument("TrackGestureController: minWidthSubdivisions must be >= 1");
}

TrackGestureController::~TrackGestureController() = default;

// ============================================================================
// Drag
// ============================================================================

void TrackGestureController::beginDrag(const TrackGeometry& track, const PixelPoint& pointer,
                                       const TempoContext& tempo) {
    if (drags_.count(track.id) > 0)
        throw std::logic_error("TrackGestureController::beginDrag() - track " +
                               std::to_string(track.id) + " is already being dragged");

    auto session = std::make_unique<DragSession>(track.id, laneHeight_);
    session->start(pointer, track, tempo);
    drags_[track.id] = std::move(session);
}

PixelPoint TrackGestureController::dragTo(TrackId trackId, const PixelPoint& pointer,
                                          const TempoContext& tempo) {
    auto position = getActiveDrag(trackId, "dragTo").update(pointer, tempo);
    notifyListeners([&](TrackGestureListener& l) { l.trackDragUpdated(trackId, position); });
    return position;
}

DragResult TrackGestureController::endDrag(TrackId trackId, const TempoContext& tempo) {
    auto result = getActiveDrag(trackId, "endDrag").commit(tempo);
    drags_.erase(trackId);

    if (result.moved) {
        notifyListeners([&](TrackGestureListener& l) { l.trackMoveCommitted(result); });
    } else {
        DBG("No position change detected for track " << trackId << " - skipping commit");
    }
    return result;
}

// ============================================================================
// Resize
// ============================================================================

bool TrackGestureController::beginResize(const TrackGeometry& track, ResizeEdge edge,
                                         double pointerX, const TempoContext& tempo,
                                         std::optional<double> widthOverride) {
    auto layout = WidthCalculator::computeLayout(track, tempo, widthOverride);
    if (!layout.canResize) {
        DBG("TrackGestureController: track " << track.id
                                             << " has no content width - resize suppressed");
        return false;
    }

    beginResize(track.id, edge, pointerX, layout.positionPixel, layout.visibleWidth,
                layout.contentOffset);
    return true;
}

void TrackGestureController::beginResize(TrackId trackId, ResizeEdge edge, double pointerX,
                                         double position, double width, double contentOffset) {
    if (resizes_.count(trackId) > 0)
        throw std::logic_error("TrackGestureController::beginResize() - track " +
                               std::to_string(trackId) + " is already being resized");

    auto session = std::make_unique<ResizeSession>(trackId, minWidthSubdivisions_);
    session->start(edge, pointerX, position, width, contentOffset);
    resizes_[trackId] = std::move(session);
}

ResizeUpdate TrackGestureController::resizeTo(TrackId trackId, double pointerX,
                                              const TempoContext& tempo) {
    auto update = getActiveResize(trackId, "resizeTo").update(pointerX, tempo);
    notifyListeners([&](TrackGestureListener& l) { l.trackResizeUpdated(trackId, update); });
    return update;
}

ResizeResult TrackGestureController::endResize(TrackId trackId) {
    auto result = getActiveResize(trackId, "endResize").commit();
    resizes_.erase(trackId);

    if (result.deltaPixels != 0.0) {
        notifyListeners([&](TrackGestureListener& l) { l.trackResizeCommitted(result); });
    } else {
        DBG("No size change detected for track " << trackId << " - skipping commit");
    }
    return result;
}

// ============================================================================
// Lifetime
// ============================================================================

void TrackGestureController::discardGestures(TrackId trackId) {
    bool hadGesture = drags_.erase(trackId) > 0;
    hadGesture = resizes_.erase(trackId) > 0 || hadGesture;

    if (hadGesture) {
        DBG("Discarded gestures on track " << trackId);
        notifyListeners([&](TrackGestureListener& l) { l.trackGestureDiscarded(trackId); });
    }
}

void TrackGestureController::discardAll() {
    std::vector<TrackId> trackIds;
    for (const auto& entry : drags_)
        trackIds.push_back(entry.first);
    for (const auto& entry : resizes_)
        if (drags_.count(entry.first) == 0)
            trackIds.push_back(entry.first);

    for (auto trackId : trackIds)
        discardGestures(trackId);
}

bool TrackGestureController::isDragging(TrackId trackId) const {
    return drags_.count(trackId) > 0;
}

bool TrackGestureController::isResizing(TrackId trackId) const {
    return resizes_.count(trackId) > 0;
}

int TrackGestureController::getNumActiveGestures() const {
    return static_cast<int>(drags_.size() + resizes_.size());
}

// ============================================================================
// Helpers
// ============================================================================

DragSession& TrackGestureController::getActiveDrag(TrackId trackId, const char* operation) {
    auto it = drags_.find(trackId);
    if (it == drags_.end())
        throw std::logic_error(std::string("TrackGestureController::") + operation +
                               "() - no active drag on track " + std::to_string(trackId));
    return *it->second;
}

ResizeSession& TrackGestureController::getActiveResize(TrackId trackId, const char* operation) {
    auto it = resizes_.find(trackId);
    if (it == resizes_.end())
        throw std::logic_error(std::string("TrackGestureController::") + operation +
                               "() - no active resize on track " + std::to_string(trackId));
    return *it->second;
}

// ============================================================================
// Listener Management
// ============================================================================

void TrackGestureController::addListener(TrackGestureListener* listener) {
    if (listener && std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end()) {
        listeners_.push_back(listener);
    }
}

void TrackGestureController::removeListener(TrackGestureListener* listener) {
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

void TrackGestureController::notifyListeners(
    const std::function<void(TrackGestureListener&)>& callback) {
    // Copy: listeners may remove themselves while handling a commit
    auto listenersCopy = listeners_;
    for (auto* listener : listenersCopy) {
        if (std::find(listeners_.begin(), listeners_.end(), listener) != listeners_.end()) {
            callback(*listener);
        }
    }
}

}  // namespace timegrid
