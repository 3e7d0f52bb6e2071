#include "ResizeSession.hpp"

#include <juce_core/juce_core.h>

#include <stdexcept>
#include <string>

#include "../core/GridSnapper.hpp"

namespace timegrid {

ResizeSession::ResizeSession(TrackId trackId, int minWidthSubdivisions)
    : trackId_(trackId), minWidthSubdivisions_(minWidthSubdivisions) {
    if (minWidthSubdivisions_ < 1)
        throw std::invalid_argument("ResizeSession: minWidthSubdivisions must be >= 1, got " +
                                    std::to_string(minWidthSubdivisions_));
}

void ResizeSession::start(ResizeEdge edge, double pointerX, double visiblePosition,
                          double visibleWidth, double contentOffset) {
    if (active_)
        throw std::logic_error("ResizeSession::start() - resize already active on track " +
                               std::to_string(trackId_));

    edge_ = edge;
    anchorPointerX_ = pointerX;
    anchorPosition_ = visiblePosition;
    anchorWidth_ = visibleWidth;
    anchorContentOffset_ = contentOffset;

    current_.positionPixel = visiblePosition;
    current_.widthPixel = visibleWidth;
    current_.contentOffsetPixel = contentOffset;
    active_ = true;

    DBG("ResizeSession: start track=" << trackId_ << " edge=" << getResizeEdgeName(edge)
                                      << " x=" << visiblePosition << " width=" << visibleWidth
                                      << " offset=" << contentOffset);
}

void ResizeSession::start(ResizeEdge edge, double pointerX, const TrackLayout& layout) {
    start(edge, pointerX, layout.positionPixel, layout.visibleWidth, layout.contentOffset);
}

ResizeUpdate ResizeSession::update(double pointerX, const TempoContext& tempo) {
    requireActive("update");

    double subdivision = GridSnapper::subdivisionWidth(tempo);
    double minWidth = subdivision * minWidthSubdivisions_;
    double deltaX = pointerX - anchorPointerX_;

    if (edge_ == ResizeEdge::Right) {
        current_.widthPixel = GridSnapper::snap(anchorWidth_ + deltaX, subdivision, minWidth);
        current_.positionPixel = anchorPosition_;
        current_.contentOffsetPixel = anchorContentOffset_;
    } else {
        double rightEdge = anchorPosition_ + anchorWidth_;

        double snappedX = GridSnapper::snap(juce::jmax(0.0, anchorPosition_ + deltaX), subdivision);
        double width = GridSnapper::snap(rightEdge - snappedX, subdivision, minWidth);

        // Derive x from the clamped width so the right edge cannot drift
        current_.widthPixel = width;
        current_.positionPixel = rightEdge - width;
        current_.contentOffsetPixel =
            anchorContentOffset_ - (current_.positionPixel - anchorPosition_);
    }

    return current_;
}

ResizeResult ResizeSession::commit() {
    requireActive("commit");

    ResizeResult result;
    result.trackId = trackId_;
    result.edge = edge_;
    result.deltaPixels = edge_ == ResizeEdge::Right ? current_.widthPixel - anchorWidth_
                                                    : current_.positionPixel - anchorPosition_;
    active_ = false;

    DBG("ResizeSession: commit track=" << trackId_ << " edge=" << getResizeEdgeName(edge_)
                                       << " delta=" << result.deltaPixels);
    return result;
}

ResizeEdge ResizeSession::getEdge() const {
    requireActive("getEdge");
    return edge_;
}

double ResizeSession::getAnchorPosition() const {
    requireActive("getAnchorPosition");
    return anchorPosition_;
}

double ResizeSession::getAnchorWidth() const {
    requireActive("getAnchorWidth");
    return anchorWidth_;
}

double ResizeSession::getAnchorContentOffset() const {
    requireActive("getAnchorContentOffset");
    return anchorContentOffset_;
}

ResizeUpdate ResizeSession::getCurrent() const {
    requireActive("getCurrent");
    return current_;
}

void ResizeSession::requireActive(const char* operation) const {
    if (!active_)
        throw std::logic_error(std::string("ResizeSession::") + operation +
                               "() called without an active resize on track " +
                               std::to_string(trackId_));
}

}  // namespace timegrid
