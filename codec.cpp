#include <algorithm>
#include <cmath>
#include <cstddef>
#include <errno.h>
#include <fstream>
#include <memory>
#include <stdio.h>
#include <string.h>
#include <string>
#include <utility>
#include <vector>

#include <lame/lame.h>
#include <sndfile.h>

#include "codec.hpp"

using std::string;
using std::vector;

using SndFilePtr = std::unique_ptr<SNDFILE, decltype(&::sf_close)>;
using LamePtr    = std::unique_ptr<lame_global_flags, decltype(&::lame_close)>;

static constexpr sf_count_t FRAMES_PER_CHUNK = 4096;


// output is written beside its destination and only renamed into place on
// commit(), otherwise the partial file is removed
class PartFile
{
public:
    explicit PartFile(string dest)
        : dest_(std::move(dest))
        , part_(dest_ + ".part")
    {}

    ~PartFile()
    {
        if (!committed_)
            ::remove(part_.c_str());
    }

    PartFile(PartFile const&) = delete;
    PartFile& operator=(PartFile const&) = delete;

    string const& path() const { return part_; }

    void commit()
    {
#if defined (_WIN32)
        ::remove(dest_.c_str()); // rename() doesn't replace on Windows
#endif
        if (::rename(part_.c_str(), dest_.c_str()) != 0)
            throw EncodeError("can't move " + part_ + " to " + dest_ + ": " + ::strerror(errno));

        committed_ = true;
    }

private:
    string dest_;
    string part_;
    bool   committed_ = false;
};


static BitDepth depthOf(int sfFormat)
{
    switch (sfFormat & SF_FORMAT_SUBMASK) {
    case SF_FORMAT_PCM_S8:
    case SF_FORMAT_PCM_U8:
    case SF_FORMAT_PCM_16:
        return BitDepth::Pcm16;
    case SF_FORMAT_PCM_24:
        return BitDepth::Pcm24;
    default: // 32 bit PCM, float, compressed
        return BitDepth::Pcm32;
    }
}

static int subtypeOf(BitDepth depth)
{
    switch (depth) {
    case BitDepth::Pcm16: return SF_FORMAT_PCM_16;
    case BitDepth::Pcm24: return SF_FORMAT_PCM_24;
    case BitDepth::Pcm32: return SF_FORMAT_PCM_32;
    }
    return SF_FORMAT_PCM_16;
}

// round to nearest, clamped to the signed range of bits
static int64_t quantize(float v, int bits)
{
    double const scale = std::ldexp(1.0, bits - 1);
    double const q     = std::round(static_cast<double>(v) * scale);
    return static_cast<int64_t>(std::min(scale - 1.0, std::max(-scale, q)));
}


SampleBuffer decodeFile(string const& path)
{
    SF_INFO info;
    ::memset(&info, 0, sizeof(info));

    SndFilePtr file(::sf_open(path.c_str(), SFM_READ, &info), &::sf_close);
    if (!file)
        throw DecodeError(string("can't open: ") + ::sf_strerror(nullptr));

    if (info.channels <= 0 || info.samplerate <= 0)
        throw DecodeError("broken header: " + std::to_string(info.channels) + " channels at "
                          + std::to_string(info.samplerate) + " Hz");

    SampleBuffer buffer;
    buffer.sampleRate   = info.samplerate;
    buffer.channelCount = info.channels;
    buffer.bitDepth     = depthOf(info.format);

    ::sf_command(file.get(), SFC_SET_NORM_FLOAT, nullptr, SF_TRUE);

    auto const channels = static_cast<size_t>(info.channels);
    if (info.frames > 0 && info.frames < SF_COUNT_MAX)
        buffer.samples.reserve(static_cast<size_t>(info.frames) * channels);

    auto chunk = vector<float>(static_cast<size_t>(FRAMES_PER_CHUNK) * channels, 0.0f);

    for (;;) {
        auto const framesRead = ::sf_readf_float(file.get(), chunk.data(), FRAMES_PER_CHUNK);
        if (framesRead <= 0)
            break;

        buffer.samples.insert(buffer.samples.end(), chunk.begin(),
                              chunk.begin() + static_cast<std::ptrdiff_t>(static_cast<size_t>(framesRead) * channels));
    }

    if (::sf_error(file.get()) != SF_ERR_NO_ERROR)
        throw DecodeError(string("read failed: ") + ::sf_strerror(file.get()));

    return buffer;
}


static void encodeSndfile(SampleBuffer const& buffer, string const& path, OutputFormat format)
{
    SF_INFO info;
    ::memset(&info, 0, sizeof(info));
    info.samplerate = buffer.sampleRate;
    info.channels   = buffer.channelCount;
    info.format     = (format == OutputFormat::Flac ? SF_FORMAT_FLAC : SF_FORMAT_WAV) | subtypeOf(buffer.bitDepth);

    if (!::sf_format_check(&info))
        throw EncodeError(string("unsupported output format: ") + extentionOf(format) + ", "
                          + std::to_string(bitsOf(buffer.bitDepth)) + " bit, "
                          + std::to_string(buffer.channelCount) + " channels");

    SndFilePtr file(::sf_open(path.c_str(), SFM_WRITE, &info), &::sf_close);
    if (!file)
        throw EncodeError(string("can't create ") + path + ": " + ::sf_strerror(nullptr));

    // sf_writef_int() takes samples left aligned in 32 bits
    int const bits     = bitsOf(buffer.bitDepth);
    int64_t const unit = int64_t(1) << (32 - bits);
    auto const channels = static_cast<size_t>(buffer.channelCount);
    auto const frames   = buffer.frames();
    auto chunk = vector<int32_t>(static_cast<size_t>(FRAMES_PER_CHUNK) * channels, 0);

    for (size_t done = 0; done < frames; ) {
        auto const n = std::min(frames - done, static_cast<size_t>(FRAMES_PER_CHUNK));
        auto const src = buffer.samples.begin() + static_cast<std::ptrdiff_t>(done * channels);

        std::transform(src, src + static_cast<std::ptrdiff_t>(n * channels), chunk.begin(),
                       [bits, unit](float v) { return static_cast<int32_t>(quantize(v, bits) * unit); });

        if (::sf_writef_int(file.get(), chunk.data(), static_cast<sf_count_t>(n)) != static_cast<sf_count_t>(n))
            throw EncodeError(string("write failed: ") + ::sf_strerror(file.get()));

        done += n;
    }

    if (int const rc = ::sf_close(file.release()))
        throw EncodeError(string("close failed: ") + ::sf_error_number(rc));
}


// test lame functions for success or throw with details
static void okOrThrow(int32_t status, int line)
{
    if (status != lame_errorcodes_t::LAME_OKAY)
        throw EncodeError("lame failed with code " + std::to_string(status) + " at line " + std::to_string(line));
}

// sadly, lame doesn't support multithread encoding for a single file...
static void encodeMp3(SampleBuffer const& buffer, string const& path)
{
    if (buffer.channelCount > 2)
        throw EncodeError("MP3 output supports mono or stereo only, got "
                          + std::to_string(buffer.channelCount) + " channels");

    LamePtr pLameGF(::lame_init(), &::lame_close);
    if (!pLameGF)
        throw EncodeError("lame_init() failed");

    bool const isMono = buffer.channelCount == 1;

    okOrThrow(::lame_set_num_channels (pLameGF.get(), buffer.channelCount),   __LINE__);
    okOrThrow(::lame_set_mode         (pLameGF.get(), isMono ? MONO : STEREO), __LINE__);
    okOrThrow(::lame_set_in_samplerate(pLameGF.get(), buffer.sampleRate),     __LINE__);
    okOrThrow(::lame_set_VBR          (pLameGF.get(), vbr_off),               __LINE__); // keep it off, affects mp3 length somehow
    okOrThrow(::lame_set_quality      (pLameGF.get(), 5),                     __LINE__);
    okOrThrow(::lame_init_params      (pLameGF.get()),                        __LINE__);

    const constexpr size_t MP3_BUF_SIZE = 5 * FRAMES_PER_CHUNK / 4 + 7200; // worst case per lame.h

    auto         pcmBuffer = vector<int16_t>(static_cast<size_t>(FRAMES_PER_CHUNK) * 2, 0);
    auto         mp3Buffer = vector<uint8_t>(MP3_BUF_SIZE, 0);
    auto         outMp3    = std::ofstream(path.c_str(), std::ios_base::binary | std::ofstream::out);
    auto const   channels  = static_cast<size_t>(buffer.channelCount);
    auto const   frames    = buffer.frames();
    int32_t      toWrite   = 0;

    if (!outMp3)
        throw EncodeError("can't create " + path + ": " + ::strerror(errno));

    for (size_t done = 0; done < frames; ) {
        auto const n   = std::min(frames - done, static_cast<size_t>(FRAMES_PER_CHUNK));
        auto const src = buffer.samples.begin() + static_cast<std::ptrdiff_t>(done * channels);

        std::transform(src, src + static_cast<std::ptrdiff_t>(n * channels), pcmBuffer.begin(),
                       [](float v) { return static_cast<int16_t>(quantize(v, 16)); });

        if (isMono)
            toWrite = ::lame_encode_buffer(pLameGF.get(), pcmBuffer.data(), pcmBuffer.data(), static_cast<int>(n),
                                           mp3Buffer.data(), static_cast<int>(MP3_BUF_SIZE));
        else
            toWrite = ::lame_encode_buffer_interleaved(pLameGF.get(), pcmBuffer.data(), static_cast<int>(n),
                                                       mp3Buffer.data(), static_cast<int>(MP3_BUF_SIZE));

        if (toWrite < 0)
            okOrThrow(toWrite, __LINE__);

        outMp3.write(reinterpret_cast<char*>(mp3Buffer.data()), toWrite);
        done += n;
    }

    toWrite = ::lame_encode_flush(pLameGF.get(), mp3Buffer.data(), static_cast<int>(MP3_BUF_SIZE));
    if (toWrite < 0)
        okOrThrow(toWrite, __LINE__);

    outMp3.write(reinterpret_cast<char*>(mp3Buffer.data()), toWrite);
    outMp3.flush();
    outMp3.close();

    if (!outMp3)
        throw EncodeError("write failed: " + path);
}


void encodeFile(SampleBuffer const& buffer, string const& path, OutputFormat format)
{
    if (buffer.channelCount <= 0 || buffer.sampleRate <= 0)
        throw EncodeError("invalid buffer format: " + describeBuffer(buffer));

    PartFile part(path);

    if (format == OutputFormat::Mp3)
        encodeMp3(buffer, part.path());
    else
        encodeSndfile(buffer, part.path(), format);

    part.commit();
}

char const* extentionOf(OutputFormat format)
{
    switch (format) {
    case OutputFormat::Wav:  return "wav";
    case OutputFormat::Flac: return "flac";
    case OutputFormat::Mp3:  return "mp3";
    }
    return "wav";
}

std::string describeBuffer(SampleBuffer const& buffer)
{
    return "sr=" + std::to_string(buffer.sampleRate)
        + ", bits=" + std::to_string(bitsOf(buffer.bitDepth))
        + ", ch=" + std::to_string(buffer.channelCount)
        + ", frames=" + std::to_string(buffer.frames());
}
