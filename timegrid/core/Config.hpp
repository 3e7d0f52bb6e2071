#pragma once

#include <string>

namespace timegrid {

/**
 * Configuration class holding editor defaults for the arrangement surface.
 *
 * Conversions never read from here: every call receives an explicit
 * TempoContext. Config only supplies defaults to callers that ask for them
 * (TempoContext::fromConfig, TrackGestureController).
 */
class Config {
  public:
    static Config& getInstance();

    // Tempo defaults
    double getDefaultBpm() const {
        return defaultBpm;
    }
    void setDefaultBpm(double bpm) {
        defaultBpm = bpm;
    }

    int getDefaultBeatsPerMeasure() const {
        return defaultBeatsPerMeasure;
    }
    void setDefaultBeatsPerMeasure(int beats) {
        defaultBeatsPerMeasure = beats;
    }

    int getDefaultBeatUnit() const {
        return defaultBeatUnit;
    }
    void setDefaultBeatUnit(int unit) {
        defaultBeatUnit = unit;
    }

    // Zoom
    double getDefaultPixelsPerMeasure() const {
        return defaultPixelsPerMeasure;
    }
    void setDefaultPixelsPerMeasure(double pixels) {
        defaultPixelsPerMeasure = pixels;
    }

    // Lane layout
    double getLaneHeight() const {
        return laneHeight;
    }
    void setLaneHeight(double height) {
        laneHeight = height;
    }

    // Resize limits
    int getMinTrackWidthSubdivisions() const {
        return minTrackWidthSubdivisions;
    }
    void setMinTrackWidthSubdivisions(int subdivisions) {
        minTrackWidthSubdivisions = subdivisions;
    }

    // New track length
    int getDefaultTrackBars() const {
        return defaultTrackBars;
    }
    void setDefaultTrackBars(int bars) {
        defaultTrackBars = bars;
    }

    void resetToDefaults();

    void saveToFile(const std::string& filename);
    void loadFromFile(const std::string& filename);

  private:
    Config() = default;

    // Helper to parse a single config line
    void parseConfigLine(const std::string& key, const std::string& value);

    double defaultBpm = 120.0;
    int defaultBeatsPerMeasure = 4;
    int defaultBeatUnit = 4;
    double defaultPixelsPerMeasure = 200.0;  // Width of one measure at default zoom

    double laneHeight = 80.0;  // Fixed height of one track lane

    int minTrackWidthSubdivisions = 1;  // Resize never shrinks below this many grid units
    int defaultTrackBars = 4;           // Length of a freshly created track
};

}  // namespace timegrid
