#pragma once

#include <optional>

#include "TempoContext.hpp"
#include "TrackGeometry.hpp"

namespace timegrid {

/**
 * @brief Resolved horizontal geometry of one track block
 *
 * The visible container is visibleWidth wide at positionPixel; inside it the
 * full content block is fullContentWidth wide and shifted by contentOffset so
 * only the trimmed window shows.
 */
struct TrackLayout {
    double positionPixel = 0.0;
    double lanePixel = 0.0;
    double fullContentWidth = 0.0;
    double visibleWidth = 0.0;
    double contentOffset = 0.0;
    bool isLoaded = false;   // fullContentWidth > 0
    bool canResize = false;  // Loaded with a non-empty visible window
};

/**
 * @brief Track width computation
 *
 * The only place where track families differ: continuous media are sized
 * from elapsed seconds (follows BPM), discrete content from its maximum
 * event end in ticks (follows the time signature). Everything downstream
 * works with the resulting pixel widths.
 *
 * Zero-length content yields zero widths, never a division by zero.
 * All methods are stateless.
 */
class WidthCalculator {
  public:
    /** Width of continuous content lasting the given number of seconds */
    static double continuousContentWidth(double seconds, const TempoContext& tempo);

    /** Width of discrete content whose last event ends at the given tick */
    static double discreteContentWidth(double maxEventEndTicks, const TempoContext& tempo);

    /**
     * @brief Full untrimmed content width for a track
     * Dispatches on the track's ContentKind.
     */
    static double fullContentWidth(const TrackGeometry& track, const TempoContext& tempo);

    /**
     * @brief Width of the visible (trimmed) window
     * @param fullWidth Full content width in pixels
     * @param track Trim state source
     * @param widthOverride Used verbatim when set (e.g. mid-resize)
     */
    static double visibleWidth(double fullWidth, const TrackGeometry& track,
                               std::optional<double> widthOverride = std::nullopt);

    static double visibleWidth(const TrackGeometry& track, const TempoContext& tempo,
                               std::optional<double> widthOverride = std::nullopt);

    /**
     * @brief Horizontal shift applied to the full content block
     * @return -(trimStart / originalDuration) * fullWidth, or 0 when untrimmed
     */
    static double contentOffset(double fullWidth, const TrackGeometry& track);

    static double contentOffset(const TrackGeometry& track, const TempoContext& tempo);

    /** Position, widths and offset in one pass */
    static TrackLayout computeLayout(const TrackGeometry& track, const TempoContext& tempo,
                                     std::optional<double> widthOverride = std::nullopt);
};

}  // namespace timegrid
