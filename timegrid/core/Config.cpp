#include "Config.hpp"

#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace timegrid {

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::resetToDefaults() {
    defaultBpm = 120.0;
    defaultBeatsPerMeasure = 4;
    defaultBeatUnit = 4;
    defaultPixelsPerMeasure = 200.0;
    laneHeight = 80.0;
    minTrackWidthSubdivisions = 1;
    defaultTrackBars = 4;
}

void Config::saveToFile(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file for writing: " << filename << std::endl;
        return;
    }

    file << "defaultBpm=" << defaultBpm << std::endl;
    file << "defaultBeatsPerMeasure=" << defaultBeatsPerMeasure << std::endl;
    file << "defaultBeatUnit=" << defaultBeatUnit << std::endl;
    file << "defaultPixelsPerMeasure=" << defaultPixelsPerMeasure << std::endl;
    file << "laneHeight=" << laneHeight << std::endl;
    file << "minTrackWidthSubdivisions=" << minTrackWidthSubdivisions << std::endl;
    file << "defaultTrackBars=" << defaultTrackBars << std::endl;

    file.close();
    std::cout << "Config saved to: " << filename << std::endl;
}

void Config::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cout << "Config file not found, using defaults: " << filename << std::endl;
        return;
    }

    std::string line;
    while (std::getline(file, line)) {
        size_t equalPos = line.find('=');
        if (equalPos == std::string::npos)
            continue;

        std::string key = line.substr(0, equalPos);
        std::string value = line.substr(equalPos + 1);

        parseConfigLine(key, value);
    }

    file.close();
    std::cout << "Config loaded from: " << filename << std::endl;
}

void Config::parseConfigLine(const std::string& key, const std::string& value) {
    try {
        double numValue = std::stod(value);

        // Non-positive values would break every conversion downstream
        if (!std::isfinite(numValue) || numValue <= 0.0) {
            std::cerr << "Ignoring non-positive or non-finite config value: " << key << "=" << value
                      << std::endl;
            return;
        }

        if (key == "defaultBpm") {
            defaultBpm = numValue;
        } else if (key == "defaultPixelsPerMeasure") {
            defaultPixelsPerMeasure = numValue;
        } else if (key == "laneHeight") {
            laneHeight = numValue;
        } else if (numValue < 1.0 ||
                   numValue > static_cast<double>(std::numeric_limits<int>::max())) {
            // Remaining keys are counts
            std::cerr << "Ignoring config count out of range: " << key << "=" << value
                      << std::endl;
        } else if (key == "defaultBeatsPerMeasure") {
            defaultBeatsPerMeasure = static_cast<int>(numValue);
        } else if (key == "defaultBeatUnit") {
            defaultBeatUnit = static_cast<int>(numValue);
        } else if (key == "minTrackWidthSubdivisions") {
            minTrackWidthSubdivisions = static_cast<int>(numValue);
        } else if (key == "defaultTrackBars") {
            defaultTrackBars = static_cast<int>(numValue);
        }
        // Skip unknown keys silently
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config value: " << key << "=" << value << " (" << e.what()
                  << ")" << std::endl;
    }
}

}  // namespace timegrid
