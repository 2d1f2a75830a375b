#ifndef CODEC_H
#define CODEC_H

#include "batchaudio.hpp"

// any container libsndfile reads (WAV, FLAC, OGG, AIFF, MP3, ...);
// throws DecodeError
SampleBuffer decodeFile(std::string const& path);

// WAV/FLAC through libsndfile at the buffer's bit depth, MP3 through LAME.
// The file appears at path only once fully written; throws EncodeError
void encodeFile(SampleBuffer const& buffer, std::string const& path, OutputFormat format);

char const* extentionOf(OutputFormat format);
std::string describeBuffer(SampleBuffer const& buffer);

#endif // CODEC_H
