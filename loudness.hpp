#ifndef LOUDNESS_H
#define LOUDNESS_H

#include "batchaudio.hpp"

// Integrated loudness (ITU-R BS.1770-4 / EBU R128, gated) in LUFS.
// Returns false when it is undefined: no frames, shorter than one 400 ms
// gating block, or everything below the -70 LUFS absolute gate.
// Throws TransformError if the meter can't be set up.
bool measureLoudness(SampleBuffer const& buffer, double& lufs);

// Uniform gain so the integrated loudness becomes targetLufs, samples past
// full scale are clamped for the buffer's bit depth. Undefined loudness
// passes the buffer through unchanged.
SampleBuffer normalizeLoudness(SampleBuffer const& buffer, double targetLufs);

#endif // LOUDNESS_H
