#include "TempoContext.hpp"

#include <stdexcept>
#include <string>

#include "Config.hpp"

namespace timegrid {

TempoContext TempoContext::fromConfig() {
    const auto& config = Config::getInstance();
    return TempoContext(config.getDefaultBpm(),
                        {config.getDefaultBeatsPerMeasure(), config.getDefaultBeatUnit()},
                        config.getDefaultPixelsPerMeasure());
}

void TempoContext::validate() const {
    if (!(bpm > 0.0) || !std::isfinite(bpm))
        throw std::invalid_argument("TempoContext: bpm must be positive, got " +
                                    std::to_string(bpm));

    if (timeSignature.beatsPerMeasure <= 0)
        throw std::invalid_argument("TempoContext: beatsPerMeasure must be positive, got " +
                                    std::to_string(timeSignature.beatsPerMeasure));

    if (timeSignature.beatUnit <= 0)
        throw std::invalid_argument("TempoContext: beatUnit must be positive, got " +
                                    std::to_string(timeSignature.beatUnit));

    if (!(pixelsPerMeasure > 0.0) || !std::isfinite(pixelsPerMeasure))
        throw std::invalid_argument("TempoContext: pixelsPerMeasure must be positive, got " +
                                    std::to_string(pixelsPerMeasure));
}

}  // namespace timegrid
