#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>

#include "trim.hpp"

static float framePeak(SampleBuffer const& buffer, size_t frame)
{
    auto const channels = static_cast<size_t>(buffer.channelCount);
    auto const first    = buffer.samples.begin() + static_cast<std::ptrdiff_t>(frame * channels);
    float peak = 0.0f;

    std::for_each(first, first + static_cast<std::ptrdiff_t>(channels),
                  [&peak](float v) { peak = std::max(peak, std::fabs(v)); });

    return peak;
}

SampleBuffer trimSilence(SampleBuffer const& buffer, double thresholdDb)
{
    if (!std::isfinite(thresholdDb) || thresholdDb < 0.0)
        throw TransformError("silence threshold must be a positive dB value, got " + std::to_string(thresholdDb));

    if (buffer.channelCount <= 0)
        throw TransformError("buffer has no channels");

    auto const threshold   = static_cast<float>(std::pow(10.0, -thresholdDb / 20.0));
    auto const totalFrames = buffer.frames();

    SampleBuffer out;
    out.sampleRate   = buffer.sampleRate;
    out.bitDepth     = buffer.bitDepth;
    out.channelCount = buffer.channelCount;

    size_t first = 0;
    while (first < totalFrames && framePeak(buffer, first) < threshold)
        ++first;

    if (first == totalFrames)
        return out; // all silence

    size_t last = totalFrames - 1;
    while (last > first && framePeak(buffer, last) < threshold)
        --last;

    auto const channels = static_cast<size_t>(buffer.channelCount);
    out.samples.assign(buffer.samples.begin() + static_cast<std::ptrdiff_t>(first * channels),
                       buffer.samples.begin() + static_cast<std::ptrdiff_t>((last + 1) * channels));
    return out;
}
