#pragma once

#include <juce_core/juce_core.h>

#include <cmath>

#include "TempoContext.hpp"

namespace timegrid {

/**
 * @brief Grid rounding for pixel and tick values
 *
 * The grid unit is one subdivision: pixelsPerMeasure divided by
 * (beatsPerMeasure * beatUnit). A 6/8 signature therefore snaps finer
 * than 4/4 at the same zoom.
 */
namespace GridSnapper {

/**
 * Round a value to the nearest grid multiple, then clamp to a floor
 * @param value Pixel or tick value
 * @param gridSize Grid interval (non-positive disables rounding)
 * @param minValue Lower bound applied after rounding
 * @return Snapped value, never below minValue
 */
inline double snap(double value, double gridSize, double minValue = 0.0) {
    double snapped = value;
    if (gridSize > 0.0)
        snapped = std::round(value / gridSize) * gridSize;
    return juce::jmax(minValue, snapped);
}

/**
 * Width of one grid subdivision in pixels for the given context
 */
inline double subdivisionWidth(const TempoContext& tempo) {
    tempo.validate();
    return tempo.getSubdivisionWidth();
}

/**
 * Length of one grid subdivision in ticks
 */
inline double subdivisionTicks(const TimeSignature& signature) {
    return static_cast<double>(TICKS_PER_BEAT) / signature.beatUnit;
}

/** Snap a pixel offset to the subdivision grid, never below zero */
inline double snapPixels(double pixels, const TempoContext& tempo) {
    return snap(pixels, subdivisionWidth(tempo));
}

/** Snap a tick offset to the subdivision grid, never below zero */
inline double snapTicks(double ticks, const TempoContext& tempo) {
    tempo.validate();
    return snap(ticks, subdivisionTicks(tempo.timeSignature));
}

/**
 * Check if a pixel value lies within a threshold of a grid line
 */
inline bool isWithinSnapRange(double pixels, double gridSize, double thresholdPixels) {
    if (gridSize <= 0.0)
        return false;
    double snapped = std::round(pixels / gridSize) * gridSize;
    return std::abs(snapped - pixels) <= thresholdPixels;
}

/**
 * Magnetic variant: snap only when already close to a grid line
 */
inline double magneticSnap(double pixels, double gridSize, double thresholdPixels) {
    if (isWithinSnapRange(pixels, gridSize, thresholdPixels))
        return std::round(pixels / gridSize) * gridSize;
    return pixels;
}

}  // namespace GridSnapper

}  // namespace timegrid
