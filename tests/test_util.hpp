#ifndef TEST_UTIL_H
#define TEST_UTIL_H

#include <cmath>
#include <fstream>
#include <iostream>
#include <stdio.h>
#include <stdlib.h>
#include <string>
#include <ftw.h>
#include <sys/stat.h>

#include "batchaudio.hpp"

static int testFailures = 0;
static double const PI = 3.14159265358979323846;

static void check(bool ok, int line)
{
    if (!ok) {
        std::cerr << "check failed at line " << line << "\n";
        ++testFailures;
    }
}

// fn must throw Error
template <typename Error, typename Fn>
static void checkThrows(Fn fn, int line)
{
    try {
        fn();
    }
    catch (Error const&) {
        return;
    }

    std::cerr << "expected exception not thrown at line " << line << "\n";
    ++testFailures;
}

static int testResult()
{
    if (testFailures > 0)
        std::cerr << testFailures << " check(s) failed\n";
    return testFailures == 0 ? 0 : -1;
}

static std::string makeTempDir()
{
    char tmpl[] = "/tmp/batchaudio_test_XXXXXX";
    char const* dir = ::mkdtemp(tmpl);
    if (!dir) {
        ::perror("mkdtemp");
        ::exit(-1);
    }
    return dir;
}

static int removeEntry(char const* path, struct stat const*, int, struct FTW*)
{
    return ::remove(path);
}

static void removeTree(std::string const& dir)
{
    ::nftw(dir.c_str(), &removeEntry, 16, FTW_DEPTH | FTW_PHYS);
}

static bool fileExists(std::string const& path)
{
    struct stat s;
    return ::stat(path.c_str(), &s) == 0;
}

static void writeTextFile(std::string const& path, std::string const& text)
{
    std::ofstream out(path.c_str(), std::ios_base::binary);
    out << text;
}

// sine of amplitude amp on every channel
static SampleBuffer makeSine(int32_t rate, int32_t channels, size_t frames,
                             double freq, double amp, BitDepth depth = BitDepth::Pcm32)
{
    SampleBuffer buffer;
    buffer.sampleRate   = rate;
    buffer.channelCount = channels;
    buffer.bitDepth     = depth;
    buffer.samples.resize(frames * static_cast<size_t>(channels));

    double const scale = std::ldexp(1.0, static_cast<int>(depth) - 1);

    for (size_t f = 0; f < frames; ++f) {
        double v = amp * std::sin(2.0 * PI * freq * static_cast<double>(f) / rate);
        if (depth != BitDepth::Pcm32)
            v = std::round(v * scale) / scale;

        for (int32_t ch = 0; ch < channels; ++ch)
            buffer.samples[f * static_cast<size_t>(channels) + static_cast<size_t>(ch)] = static_cast<float>(v);
    }

    return buffer;
}

#endif // TEST_UTIL_H
