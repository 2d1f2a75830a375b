#include <algorithm>
#include <cmath>
#include <memory>
#include <string>

#include <ebur128.h>

#include "loudness.hpp"
#include "log.hpp"

static void freeMeter(ebur128_state* state)
{
    if (state)
        ::ebur128_destroy(&state);
}

using MeterPtr = std::unique_ptr<ebur128_state, decltype(&freeMeter)>;

// test libebur128 functions for success or throw with details
static void okOrThrow(int status, char const* what)
{
    if (status != EBUR128_SUCCESS)
        throw TransformError(std::string("libebur128 ") + what + " failed with code " + std::to_string(status));
}

bool measureLoudness(SampleBuffer const& buffer, double& lufs)
{
    if (buffer.frames() == 0)
        return false;

    if (buffer.channelCount <= 0 || buffer.sampleRate <= 0)
        throw TransformError("invalid buffer format for loudness measurement");

    MeterPtr meter(::ebur128_init(static_cast<unsigned>(buffer.channelCount),
                                  static_cast<unsigned long>(buffer.sampleRate),
                                  EBUR128_MODE_I),
                   &freeMeter);
    if (!meter)
        throw TransformError("libebur128 init failed for " + std::to_string(buffer.channelCount)
                             + " channels at " + std::to_string(buffer.sampleRate) + " Hz");

    okOrThrow(::ebur128_add_frames_float(meter.get(), buffer.samples.data(), buffer.frames()), "add_frames");

    double measured = 0.0;
    okOrThrow(::ebur128_loudness_global(meter.get(), &measured), "loudness_global");

    if (!std::isfinite(measured))
        return false; // -HUGE_VAL, every block gated

    lufs = measured;
    return true;
}

SampleBuffer normalizeLoudness(SampleBuffer const& buffer, double targetLufs)
{
    if (!std::isfinite(targetLufs))
        throw TransformError("target loudness must be finite");

    double measured = 0.0;

    if (!measureLoudness(buffer, measured)) {
        logDebug("loudness undefined, normalization skipped");
        return buffer;
    }

    auto const gain  = std::pow(10.0, (targetLufs - measured) / 20.0);
    auto const scale = std::ldexp(1.0, bitsOf(buffer.bitDepth) - 1);
    auto const hi    = (scale - 1.0) / scale;
    auto const lo    = -1.0;

    logDebug("loudness " + std::to_string(measured) + " LUFS, gain " + std::to_string(20.0 * std::log10(gain)) + " dB");

    SampleBuffer out = buffer;
    std::transform(buffer.samples.begin(), buffer.samples.end(), out.samples.begin(),
                   [gain, lo, hi](float v) { return static_cast<float>(std::min(hi, std::max(lo, v * gain))); });

    return out;
}
