#pragma once

#include "../core/TrackGeometry.hpp"
#include "../core/TypeIds.hpp"

namespace timegrid {

/**
 * @brief Pointer or block position in pixels (scroll offset already applied)
 */
struct PixelPoint {
    double x = 0.0;
    double y = 0.0;

    PixelPoint operator-(const PixelPoint& other) const {
        return {x - other.x, y - other.y};
    }
    PixelPoint operator+(const PixelPoint& other) const {
        return {x + other.x, y + other.y};
    }
    bool operator==(const PixelPoint& other) const {
        return x == other.x && y == other.y;
    }
    bool operator!=(const PixelPoint& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Which handle a resize gesture grabbed
 */
enum class ResizeEdge {
    Left,  // Moves the start, right edge stays put
    Right  // Moves the end, left edge stays put
};

inline const char* getResizeEdgeName(ResizeEdge edge) {
    switch (edge) {
        case ResizeEdge::Left:
            return "left";
        case ResizeEdge::Right:
            return "right";
    }
    return "unknown";
}

/**
 * @brief Final outcome of a position drag
 */
struct DragResult {
    TrackId trackId = INVALID_TRACK_ID;
    TickPosition positionTicks;  // x in ticks, y = laneIndex * laneHeight
    int laneIndex = 0;
    bool moved = false;  // false = released in place, owner should not persist
};

/**
 * @brief Live geometry for the block while a resize is in flight
 */
struct ResizeUpdate {
    double positionPixel = 0.0;
    double widthPixel = 0.0;
    double contentOffsetPixel = 0.0;
};

/**
 * @brief Final outcome of a resize
 *
 * Left edge: how far the start moved. Right edge: how much the width changed.
 * Converting to trim ticks is the owner's job (see TrackOperations).
 */
struct ResizeResult {
    TrackId trackId = INVALID_TRACK_ID;
    ResizeEdge edge = ResizeEdge::Right;
    double deltaPixels = 0.0;
};

}  // namespace timegrid
