#pragma once

#include <cmath>
#include <cstdio>
#include <limits>
#include <stdexcept>
#include <string>

#include "TempoContext.hpp"

namespace timegrid {

/**
 * @brief Conversions between seconds, ticks and pixels
 *
 * These are pure functions. Every call receives the TempoContext it should
 * use; nothing is cached between calls. Invalid tempo contexts throw
 * std::invalid_argument (see TempoContext::validate).
 */
namespace TimeMath {

inline void requirePositiveTicksPerMeasure(double ticksPerMeasure) {
    if (!(ticksPerMeasure > 0.0) || !std::isfinite(ticksPerMeasure))
        throw std::invalid_argument("TimeMath: ticksPerMeasure must be positive, got " +
                                    std::to_string(ticksPerMeasure));
}

/**
 * Ticks in one measure of the given signature
 * @param signature Time signature (numerator counts TICKS_PER_BEAT beats)
 * @return beatsPerMeasure * TICKS_PER_BEAT
 */
inline double ticksPerMeasure(const TimeSignature& signature) {
    if (!signature.isValid())
        throw std::invalid_argument("TimeMath: time signature must be positive");
    return static_cast<double>(signature.beatsPerMeasure) * TICKS_PER_BEAT;
}

/**
 * Convert elapsed seconds to a horizontal pixel offset
 * @param seconds Time in seconds
 * @param tempo Tempo, signature and measure width to convert with
 * @return Pixel offset from the timeline origin
 */
inline double secondsToPixels(double seconds, const TempoContext& tempo) {
    tempo.validate();
    double beatsPerSecond = tempo.bpm / 60.0;
    double totalBeats = seconds * beatsPerSecond;
    double measures = totalBeats / tempo.timeSignature.beatsPerMeasure;
    return measures * tempo.pixelsPerMeasure;
}

/**
 * Convert a horizontal pixel offset to seconds (inverse of secondsToPixels)
 */
inline double pixelsToSeconds(double pixels, const TempoContext& tempo) {
    tempo.validate();
    double measures = pixels / tempo.pixelsPerMeasure;
    double totalBeats = measures * tempo.timeSignature.beatsPerMeasure;
    return totalBeats * 60.0 / tempo.bpm;
}

/**
 * Convert a tick offset to pixels
 * @param ticks Musical offset in ticks
 * @param tempo Supplies pixelsPerMeasure
 * @param ticksPerMeasure Tick length of one measure
 */
inline double ticksToPixels(double ticks, const TempoContext& tempo, double ticksPerMeasure) {
    tempo.validate();
    requirePositiveTicksPerMeasure(ticksPerMeasure);
    return (ticks / ticksPerMeasure) * tempo.pixelsPerMeasure;
}

/** Same as above, measure length taken from the context's time signature */
inline double ticksToPixels(double ticks, const TempoContext& tempo) {
    return ticksToPixels(ticks, tempo, TimeMath::ticksPerMeasure(tempo.timeSignature));
}

/**
 * Convert pixels to a tick offset (inverse of ticksToPixels)
 */
inline double pixelsToTicks(double pixels, const TempoContext& tempo, double ticksPerMeasure) {
    tempo.validate();
    requirePositiveTicksPerMeasure(ticksPerMeasure);
    return (pixels / tempo.pixelsPerMeasure) * ticksPerMeasure;
}

inline double pixelsToTicks(double pixels, const TempoContext& tempo) {
    return pixelsToTicks(pixels, tempo, TimeMath::ticksPerMeasure(tempo.timeSignature));
}

/**
 * Convert seconds to ticks at the context's tempo
 */
inline double secondsToTicks(double seconds, const TempoContext& tempo) {
    tempo.validate();
    return seconds * tempo.bpm / 60.0 * TICKS_PER_BEAT;
}

/**
 * Convert ticks to seconds at the context's tempo
 */
inline double ticksToSeconds(double ticks, const TempoContext& tempo) {
    tempo.validate();
    return ticks / TICKS_PER_BEAT * 60.0 / tempo.bpm;
}

/**
 * Clamp negatives to zero and reject values whose bar count does not fit an int
 */
inline double requireFormattableTicks(double ticks, double measureTicks) {
    if (std::isnan(ticks) || ticks / measureTicks >= std::numeric_limits<int>::max())
        throw std::invalid_argument("TimeMath: ticks out of range for formatting, got " +
                                    std::to_string(ticks));
    return ticks < 0.0 ? 0.0 : ticks;
}

/**
 * Format a tick position as bars.beats.ticks (e.g., "1.1.000", "2.3.240")
 * Bars and beats are 1-indexed for display.
 */
inline std::string formatTicksAsBarsBeats(double ticks, const TimeSignature& signature) {
    double measureTicks = ticksPerMeasure(signature);
    double clamped = requireFormattableTicks(ticks, measureTicks);

    int bar = static_cast<int>(clamped / measureTicks) + 1;
    double withinBar = std::fmod(clamped, measureTicks);
    int beat = static_cast<int>(withinBar / TICKS_PER_BEAT) + 1;
    int tick = static_cast<int>(std::fmod(withinBar, TICKS_PER_BEAT));

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%d.%d.%03d", bar, beat, tick);
    return std::string(buffer);
}

/**
 * Format a tick length as a 0-indexed bars.beats.ticks duration (e.g., "1.0.000")
 */
inline std::string formatDurationTicks(double ticks, const TimeSignature& signature) {
    double measureTicks = ticksPerMeasure(signature);
    double clamped = requireFormattableTicks(ticks, measureTicks);

    int wholeBars = static_cast<int>(clamped / measureTicks);
    double remaining = std::fmod(clamped, measureTicks);
    int wholeBeats = static_cast<int>(remaining / TICKS_PER_BEAT);
    int tick = static_cast<int>(std::fmod(remaining, TICKS_PER_BEAT));

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%d.%d.%03d", wholeBars, wholeBeats, tick);
    return std::string(buffer);
}

}  // namespace TimeMath

}  // namespace timegrid
