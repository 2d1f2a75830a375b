#ifndef CONVERT_H
#define CONVERT_H

#include "batchaudio.hpp"

// band-limited sinc resampling through libsamplerate, no-op at equal rates
SampleBuffer resample(SampleBuffer const& buffer, int32_t targetRate);

// rounds every sample to the nearest step of a targetDepth-bit grid,
// no-op at equal depths
SampleBuffer requantize(SampleBuffer const& buffer, BitDepth targetDepth);

// resample, then requantize; throws TransformError
SampleBuffer convertFormat(SampleBuffer const& buffer, int32_t targetRate, BitDepth targetDepth);

#endif // CONVERT_H
