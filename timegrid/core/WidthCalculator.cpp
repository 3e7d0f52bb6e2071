#include "WidthCalculator.hpp"

#include "TimeMath.hpp"

namespace timegrid {

double WidthCalculator::continuousContentWidth(double seconds, const TempoContext& tempo) {
    if (seconds <= 0.0) {
        tempo.validate();
        return 0.0;
    }
    return TimeMath::secondsToPixels(seconds, tempo);
}

double WidthCalculator::discreteContentWidth(double maxEventEndTicks, const TempoContext& tempo) {
    if (maxEventEndTicks <= 0.0) {
        tempo.validate();
        return 0.0;
    }
    return TimeMath::ticksToPixels(maxEventEndTicks, tempo);
}

double WidthCalculator::fullContentWidth(const TrackGeometry& track, const TempoContext& tempo) {
    switch (track.getContentKind()) {
        case ContentKind::Continuous:
            return continuousContentWidth(track.contentExtent, tempo);
        case ContentKind::Discrete:
            return discreteContentWidth(track.contentExtent, tempo);
    }
    return 0.0;
}

double WidthCalculator::visibleWidth(double fullWidth, const TrackGeometry& track,
                                     std::optional<double> widthOverride) {
    if (widthOverride.has_value())
        return *widthOverride;

    if (fullWidth <= 0.0 || track.originalDurationTicks <= 0.0)
        return 0.0;

    if (!track.hasTrim())
        return fullWidth;

    double start = juce::jlimit(0.0, track.originalDurationTicks, track.trimStartTicks);
    double end = juce::jlimit(start, track.originalDurationTicks,
                              track.getEffectiveTrimEndTicks());

    // Ratio first so an untrimmed window reproduces fullWidth exactly
    double trimRatio = (end - start) / track.originalDurationTicks;
    return fullWidth * trimRatio;
}

double WidthCalculator::visibleWidth(const TrackGeometry& track, const TempoContext& tempo,
                                     std::optional<double> widthOverride) {
    if (widthOverride.has_value())
        return *widthOverride;
    return visibleWidth(fullContentWidth(track, tempo), track);
}

double WidthCalculator::contentOffset(double fullWidth, const TrackGeometry& track) {
    if (fullWidth <= 0.0 || track.originalDurationTicks <= 0.0 || track.trimStartTicks <= 0.0)
        return 0.0;

    double start = juce::jmin(track.trimStartTicks, track.originalDurationTicks);
    double trimRatio = start / track.originalDurationTicks;
    return -(trimRatio * fullWidth);
}

double WidthCalculator::contentOffset(const TrackGeometry& track, const TempoContext& tempo) {
    return contentOffset(fullContentWidth(track, tempo), track);
}

TrackLayout WidthCalculator::computeLayout(const TrackGeometry& track, const TempoContext& tempo,
                                           std::optional<double> widthOverride) {
    TrackLayout layout;
    layout.positionPixel = TimeMath::ticksToPixels(track.positionTicks.x, tempo);
    layout.lanePixel = track.positionTicks.y;
    layout.fullContentWidth = fullContentWidth(track, tempo);
    layout.visibleWidth = visibleWidth(layout.fullContentWidth, track, widthOverride);
    layout.contentOffset = contentOffset(layout.fullContentWidth, track);
    layout.isLoaded = layout.fullContentWidth > 0.0;
    layout.canResize = layout.isLoaded && layout.visibleWidth > 0.0;
    return layout;
}

}  // namespace timegrid
