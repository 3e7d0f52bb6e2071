#pragma once

#include <juce_core/juce_core.h>

#include <cmath>

namespace timegrid {

/**
 * @brief Standard MIDI resolution used for all tick values
 *
 * A "beat" is the counted beat of the time signature (the numerator unit),
 * so one measure always spans beatsPerMeasure * TICKS_PER_BEAT ticks.
 */
constexpr int TICKS_PER_BEAT = 480;

/**
 * @brief Time signature as (beatsPerMeasure, beatUnit), e.g. 6/8 = {6, 8}
 */
struct TimeSignature {
    int beatsPerMeasure = 4;  // Numerator
    int beatUnit = 4;         // Denominator (usually a power of two, not required)

    bool isValid() const {
        return beatsPerMeasure > 0 && beatUnit > 0;
    }

    /** Grid subdivisions in one measure (the denominator sets the density) */
    int getSubdivisionsPerMeasure() const {
        return beatsPerMeasure * beatUnit;
    }

    bool operator==(const TimeSignature& other) const {
        return beatsPerMeasure == other.beatsPerMeasure && beatUnit == other.beatUnit;
    }
    bool operator!=(const TimeSignature& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Tempo, time signature and horizontal scale for one conversion call
 *
 * Supplied by the owner on every call and never cached by sessions, since
 * tempo and zoom may change between (or during) gestures.
 */
struct TempoContext {
    double bpm = 120.0;
    TimeSignature timeSignature;
    double pixelsPerMeasure = 200.0;

    TempoContext() = default;
    TempoContext(double bpmValue, TimeSignature signature, double measureWidth)
        : bpm(bpmValue), timeSignature(signature), pixelsPerMeasure(measureWidth) {}

    /** Build a context from the Config defaults */
    static TempoContext fromConfig();

    bool isValid() const {
        return bpm > 0.0 && timeSignature.isValid() && pixelsPerMeasure > 0.0 &&
               std::isfinite(bpm) && std::isfinite(pixelsPerMeasure);
    }

    /**
     * Throws std::invalid_argument naming the offending field when the
     * context cannot be used for conversions.
     */
    void validate() const;

    double getSecondsPerBeat() const {
        return 60.0 / bpm;
    }
    double getSecondsPerMeasure() const {
        return getSecondsPerBeat() * timeSignature.beatsPerMeasure;
    }

    /** Ticks in one measure at the standard resolution */
    double getTicksPerMeasure() const {
        return static_cast<double>(timeSignature.beatsPerMeasure) * TICKS_PER_BEAT;
    }

    /** Width in pixels of the smallest snappable grid unit */
    double getSubdivisionWidth() const {
        return pixelsPerMeasure / timeSignature.getSubdivisionsPerMeasure();
    }

    bool operator==(const TempoContext& other) const {
        return bpm == other.bpm && timeSignature == other.timeSignature &&
               pixelsPerMeasure == other.pixelsPerMeasure;
    }
    bool operator!=(const TempoContext& other) const {
        return !(*this == other);
    }
};

}  // namespace timegrid
