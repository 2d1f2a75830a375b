#include <algorithm>
#include <cmath>
#include <limits>
#include <string.h>
#include <string>

#include <samplerate.h>

#include "convert.hpp"
#include "log.hpp"

static constexpr int CONVERTER_TYPE = SRC_SINC_MEDIUM_QUALITY;

SampleBuffer resample(SampleBuffer const& buffer, int32_t targetRate)
{
    if (targetRate <= 0)
        throw TransformError("target sample rate must be positive, got " + std::to_string(targetRate));

    if (buffer.sampleRate <= 0 || buffer.channelCount <= 0)
        throw TransformError("invalid buffer format for resampling");

    if (buffer.sampleRate == targetRate)
        return buffer;

    double const ratio = static_cast<double>(targetRate) / buffer.sampleRate;

    if (!::src_is_valid_ratio(ratio))
        throw TransformError("unsupported resampling ratio " + std::to_string(buffer.sampleRate)
                             + " -> " + std::to_string(targetRate) + " Hz");

    SampleBuffer out;
    out.sampleRate   = targetRate;
    out.bitDepth     = buffer.bitDepth;
    out.channelCount = buffer.channelCount;

    auto const inFrames = buffer.frames();
    if (inFrames == 0)
        return out;

    auto const outFrames = static_cast<size_t>(std::ceil(static_cast<double>(inFrames) * ratio)) + 1;

    if (outFrames > static_cast<size_t>(std::numeric_limits<long>::max()))
        throw TransformError("buffer too large for resampling");

    out.samples.resize(outFrames * static_cast<size_t>(buffer.channelCount));

    SRC_DATA data;
    ::memset(&data, 0, sizeof(data));
    data.data_in       = buffer.samples.data();
    data.data_out      = out.samples.data();
    data.input_frames  = static_cast<long>(inFrames);
    data.output_frames = static_cast<long>(outFrames);
    data.end_of_input  = 1;
    data.src_ratio     = ratio;

    if (int const err = ::src_simple(&data, CONVERTER_TYPE, buffer.channelCount))
        throw TransformError(std::string("libsamplerate: ") + ::src_strerror(err));

    out.samples.resize(static_cast<size_t>(data.output_frames_gen) * static_cast<size_t>(buffer.channelCount));

    logDebug("resampled " + std::to_string(buffer.sampleRate) + " -> " + std::to_string(targetRate)
             + " Hz, " + std::to_string(inFrames) + " -> " + std::to_string(out.frames()) + " frames");
    return out;
}

SampleBuffer requantize(SampleBuffer const& buffer, BitDepth targetDepth)
{
    if (buffer.bitDepth == targetDepth)
        return buffer;

    double const scale = std::ldexp(1.0, bitsOf(targetDepth) - 1);
    double const hi    = scale - 1.0;
    double const lo    = -scale;

    SampleBuffer out = buffer;
    out.bitDepth = targetDepth;

    std::transform(buffer.samples.begin(), buffer.samples.end(), out.samples.begin(),
                   [scale, lo, hi](float v) {
                       double const q = std::round(static_cast<double>(v) * scale);
                       return static_cast<float>(std::min(hi, std::max(lo, q)) / scale);
                   });

    return out;
}

SampleBuffer convertFormat(SampleBuffer const& buffer, int32_t targetRate, BitDepth targetDepth)
{
    return requantize(resample(buffer, targetRate), targetDepth);
}
