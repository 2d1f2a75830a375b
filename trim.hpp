#ifndef TRIM_H
#define TRIM_H

#include "batchaudio.hpp"

// Drops leading and trailing frames whose peak level (max |sample| over the
// frame's channels) stays below -thresholdDb dBFS. A buffer that is silent
// throughout comes back with zero frames. Throws TransformError on a
// negative or non-finite threshold.
SampleBuffer trimSilence(SampleBuffer const& buffer, double thresholdDb);

#endif // TRIM_H
