#ifndef BATCHAUDIO_H
#define BATCHAUDIO_H

#include <stdint.h>
#include <stdexcept>
#include <string>
#include <vector>
#include <pthread.h>

enum class PathType : uint8_t { File, Dir };

enum class BitDepth : uint8_t { Pcm16 = 16, Pcm24 = 24, Pcm32 = 32 };

enum class OutputFormat : uint8_t { Wav, Flac, Mp3 };

enum class JobStatus : uint8_t { Success, Skipped, Failed };

struct PathName
{
    PathType    type;
    std::string name;
};

// decoded audio, channel-interleaved, nominal range [-1.0, 1.0)
struct SampleBuffer
{
    std::vector<float> samples;
    int32_t            sampleRate   = 0;
    BitDepth           bitDepth     = BitDepth::Pcm16;
    int32_t            channelCount = 0;

    size_t frames() const
    {
        return channelCount > 0 ? samples.size() / static_cast<size_t>(channelCount) : 0;
    }
};

// read-only for the whole run, shared by every job
struct ProcessingConfig
{
    int32_t      targetSampleRate = 44100; // 0 keeps the source rate
    BitDepth     targetBitDepth   = BitDepth::Pcm16;
    OutputFormat outputFormat     = OutputFormat::Wav;
    bool         trimSilence      = false;
    bool         normalize        = false;
    double       targetLufs       = -12.0;
    double       silenceThreshDb  = 60.0;  // magnitude, -60 dBFS
    int32_t      jobCount         = 1;
};

struct FileJob
{
    std::string             sourcePath;
    std::string             destPath;
    ProcessingConfig const* config = nullptr;
};

struct JobOutcome
{
    std::string sourcePath;
    std::string destPath;
    JobStatus   status = JobStatus::Failed;
    std::string error; // empty unless Failed or Skipped
};

struct BatchReport
{
    size_t                   totalJobs = 0;
    size_t                   succeeded = 0;
    size_t                   skipped   = 0;
    size_t                   failed    = 0;
    std::vector<std::string> failures;  // "path: description"
    std::vector<JobOutcome>  outcomes;  // completion order
};

struct DecodeError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct TransformError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct EncodeError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct ConfigError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

// holds a pthread mutex until the end of the scope
class MutexLock
{
public:
    explicit MutexLock(pthread_mutex_t& mtx)
        : mtx_(mtx)
    {
        ::pthread_mutex_lock(&mtx_);
    }

    ~MutexLock()
    {
        ::pthread_mutex_unlock(&mtx_);
    }

    MutexLock(MutexLock const&) = delete;
    MutexLock& operator=(MutexLock const&) = delete;

private:
    pthread_mutex_t& mtx_;
};

inline int bitsOf(BitDepth depth)
{
    return static_cast<int>(depth);
}

#endif // BATCHAUDIO_H
