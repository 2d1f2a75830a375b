#include <random>
#include <vector>

#include "trim.hpp"
#include "test_util.hpp"

static SampleBuffer stereo(std::vector<float> const& left, std::vector<float> const& right)
{
    SampleBuffer buffer;
    buffer.sampleRate   = 48000;
    buffer.bitDepth     = BitDepth::Pcm24;
    buffer.channelCount = 2;

    for (size_t i = 0; i < left.size(); ++i) {
        buffer.samples.push_back(left[i]);
        buffer.samples.push_back(right[i]);
    }
    return buffer;
}

static void testTrimsBothEnds()
{
    std::vector<float> ch;
    ch.insert(ch.end(), 100, 0.0f);
    ch.insert(ch.end(), 50, 0.5f);
    ch.insert(ch.end(), 100, 1e-4f); // -80 dBFS

    auto const in  = stereo(ch, ch);
    auto const out = trimSilence(in, 60.0);

    check(out.frames() == 50, __LINE__);
    check(out.sampleRate == in.sampleRate, __LINE__);
    check(out.bitDepth == in.bitDepth, __LINE__);
    check(out.channelCount == in.channelCount, __LINE__);
    check(!out.samples.empty() && out.samples.front() == 0.5f && out.samples.back() == 0.5f, __LINE__);
}

static void testKeepsInnerSilence()
{
    std::vector<float> ch = { 0.0f, 0.3f, 0.0f, 0.0f, 0.0f, -0.3f, 0.0f };
    auto const out = trimSilence(stereo(ch, ch), 60.0);

    check(out.frames() == 5, __LINE__);
}

static void testLoudestChannelDecides()
{
    std::vector<float> left (10, 0.0f);
    std::vector<float> right(10, 0.0f);
    right[3] = 0.01f; // -40 dBFS, only on one channel
    right[6] = -0.01f;

    auto const out = trimSilence(stereo(left, right), 60.0);

    check(out.frames() == 4, __LINE__);
}

static void testThresholdLevel()
{
    std::vector<float> ch = { 0.05f, 0.05f, 0.5f, 0.05f };

    check(trimSilence(stereo(ch, ch), 60.0).frames() == 4, __LINE__);
    check(trimSilence(stereo(ch, ch), 20.0).frames() == 1, __LINE__); // -26 dBFS is below -20
}

static void testAllSilentGivesEmptyBuffer()
{
    std::vector<float> ch(480, 1e-4f);
    auto const in  = stereo(ch, ch);
    auto const out = trimSilence(in, 60.0);

    check(out.frames() == 0, __LINE__);
    check(out.samples.empty(), __LINE__);
    check(out.sampleRate == in.sampleRate, __LINE__);
    check(out.channelCount == in.channelCount, __LINE__);

    check(trimSilence(stereo({}, {}), 60.0).frames() == 0, __LINE__);
}

static void testNeverGrows()
{
    std::mt19937 rng(1234);
    std::uniform_real_distribution<float> level(-1.0f, 1.0f);
    std::uniform_int_distribution<int> length(0, 300);

    for (int round = 0; round < 50; ++round) {
        std::vector<float> left, right;
        int const frames = length(rng);
        for (int i = 0; i < frames; ++i) {
            // mostly quiet with occasional bursts
            bool const burst = (i % 37) == 0;
            left.push_back(level(rng) * (burst ? 1.0f : 1e-4f));
            right.push_back(level(rng) * 1e-4f);
        }

        auto const in = stereo(left, right);
        check(trimSilence(in, 60.0).frames() <= in.frames(), __LINE__);
    }
}

static void testBadThreshold()
{
    std::vector<float> ch(4, 0.5f);

    checkThrows<TransformError>([&] { trimSilence(stereo(ch, ch), -1.0); }, __LINE__);
    checkThrows<TransformError>([&] { trimSilence(stereo(ch, ch), std::nan("")); }, __LINE__);
}

int main()
{
    testTrimsBothEnds();
    testKeepsInnerSilence();
    testLoudestChannelDecides();
    testThresholdLevel();
    testAllSilentGivesEmptyBuffer();
    testNeverGrows();
    testBadThreshold();

    return testResult();
}
