#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <pthread.h>
#include <unistd.h>

#include "codec.hpp"
#include "filesystem.hpp"
#include "job.hpp"
#include "scheduler.hpp"
#include "test_util.hpp"

static void writeSine(std::string const& path, double amp)
{
    encodeFile(makeSine(48000, 2, 24000, 440.0, amp, BitDepth::Pcm24), path, OutputFormat::Wav);
}

static std::vector<std::pair<std::string, JobStatus>> outcomeSet(BatchReport const& report)
{
    std::vector<std::pair<std::string, JobStatus>> set;
    for (auto const& outcome : report.outcomes)
        set.emplace_back(outcome.sourcePath, outcome.status);

    std::sort(set.begin(), set.end());
    return set;
}

static std::vector<FileJob> jobsFor(std::string const& inDir, std::string const& outDir,
                                    ProcessingConfig const& config)
{
    std::string baseDir;
    auto const files = collectAudioFiles(inDir, baseDir);
    return buildJobs(files, baseDir, outDir, config);
}

// 3 files, the second one can't be decoded
static void testCorruptFileScenario(std::string const& root)
{
    auto const inDir  = root + "/scenario_in";
    auto const outDir = root + "/scenario_out";
    makeDirs(inDir);

    writeSine(inDir + "/1.wav", 0.5);
    writeTextFile(inDir + "/2.wav", "this is not a RIFF file at all");
    writeSine(inDir + "/3.wav", 0.5);

    ProcessingConfig config;
    auto const jobs   = jobsFor(inDir, outDir, config);
    auto const report = runJobs(jobs, 4);

    check(report.totalJobs == 3, __LINE__);
    check(report.succeeded == 2, __LINE__);
    check(report.failed == 1, __LINE__);
    check(report.outcomes.size() == 3, __LINE__);
    check(report.failures.size() == 1, __LINE__);

    if (report.failures.size() == 1) {
        check(report.failures[0].find("/2.wav") != std::string::npos, __LINE__);
        check(report.failures[0].find("decode error") != std::string::npos, __LINE__);
    }

    check(fileExists(outDir + "/1.wav"), __LINE__);
    check(!fileExists(outDir + "/2.wav"), __LINE__);
    check(!fileExists(outDir + "/2.wav.part"), __LINE__);
    check(fileExists(outDir + "/3.wav"), __LINE__);

    auto const written = decodeFile(outDir + "/3.wav");
    check(written.sampleRate == 44100, __LINE__);
    check(written.bitDepth == BitDepth::Pcm16, __LINE__);
    check(written.channelCount == 2, __LINE__);
    check(written.frames() > 22000 && written.frames() < 22200, __LINE__);
}

static void testOrderingAndWorkerIndependence(std::string const& root)
{
    auto const inDir = root + "/order_in";
    makeDirs(inDir + "/sub");

    writeSine(inDir + "/a.wav", 0.3);
    writeTextFile(inDir + "/b.flac", "garbage");
    writeSine(inDir + "/c.wav", 0.3);
    writeSine(inDir + "/sub/d.wav", 0.3);
    writeTextFile(inDir + "/sub/e.mp3", "");
    writeSine(inDir + "/sub/f.wav", 0.3);

    ProcessingConfig config;
    config.targetSampleRate = 0; // keep source rate
    config.targetBitDepth   = BitDepth::Pcm24;
    config.outputFormat     = OutputFormat::Flac;

    auto const sequentialJobs = jobsFor(inDir, root + "/order_seq", config);
    auto const sequential     = runJobs(sequentialJobs, 1);

    check(sequential.outcomes.size() == sequentialJobs.size(), __LINE__);
    for (size_t i = 0; i < sequential.outcomes.size() && i < sequentialJobs.size(); ++i)
        check(sequential.outcomes[i].sourcePath == sequentialJobs[i].sourcePath, __LINE__);

    check(sequential.succeeded == 4, __LINE__);
    check(sequential.failed == 2, __LINE__);
    check(fileExists(root + "/order_seq/sub/d.flac"), __LINE__);

    for (int32_t workers : { 2, 3, 8 }) {
        auto const out      = root + "/order_par" + std::to_string(workers);
        auto const parallel = runJobs(jobsFor(inDir, out, config), workers);

        check(parallel.totalJobs == sequential.totalJobs, __LINE__);
        check(parallel.succeeded == sequential.succeeded, __LINE__);
        check(parallel.failed == sequential.failed, __LINE__);
        check(outcomeSet(parallel) == outcomeSet(sequential), __LINE__);
        check(fileExists(out + "/sub/f.flac"), __LINE__);
    }
}

static void testSilentSourceIsSkipped(std::string const& root)
{
    auto const inDir  = root + "/silent_in";
    auto const outDir = root + "/silent_out";
    makeDirs(inDir);

    writeSine(inDir + "/quiet.wav", 0.0);
    writeSine(inDir + "/tone.wav", 0.5);

    ProcessingConfig config;
    config.trimSilence = true;
    config.normalize   = true;

    auto const report = runJobs(jobsFor(inDir, outDir, config), 2);

    check(report.totalJobs == 2, __LINE__);
    check(report.succeeded == 1, __LINE__);
    check(report.skipped == 1, __LINE__);
    check(report.failed == 0, __LINE__);
    check(!fileExists(outDir + "/quiet.wav"), __LINE__);
    check(fileExists(outDir + "/tone.wav"), __LINE__);
}

// same stem, three extensions, written next to the sources by 4 workers
static void testSameStemNextToSources(std::string const& root)
{
    auto const inDir = root + "/stem_in";
    makeDirs(inDir);

    writeSine(inDir + "/song.wav", 0.5);
    encodeFile(makeSine(48000, 2, 24000, 440.0, 0.5, BitDepth::Pcm24), inDir + "/song.flac", OutputFormat::Flac);
    writeSine(inDir + "/song.wave", 0.5);

    ProcessingConfig config;
    auto const jobs   = jobsFor(inDir, "", config);
    auto const report = runJobs(jobs, 4);

    check(report.totalJobs == 3, __LINE__);
    check(report.succeeded == 3, __LINE__);
    check(report.failed == 0, __LINE__);

    check(fileExists(inDir + "/song_processed.wav"), __LINE__);
    check(fileExists(inDir + "/song_wav_processed.wav"), __LINE__);
    check(fileExists(inDir + "/song_wave_processed.wav"), __LINE__);

    auto const source = decodeFile(inDir + "/song.wav");
    check(source.sampleRate == 48000, __LINE__);
    check(source.bitDepth == BitDepth::Pcm24, __LINE__);

    auto const output = decodeFile(inDir + "/song_wav_processed.wav");
    check(output.sampleRate == 44100, __LINE__);
    check(output.bitDepth == BitDepth::Pcm16, __LINE__);

    // a second run leaves the outputs of the first alone
    auto const rerun = jobsFor(inDir, "", config);
    check(rerun.size() == 3, __LINE__);
    for (size_t i = 0; i < rerun.size() && i < jobs.size(); ++i)
        check(rerun[i].destPath == jobs[i].destPath, __LINE__);
}

static void testUnwritableDestination(std::string const& root)
{
    auto const inDir = root + "/blocked_in";
    makeDirs(inDir);
    writeSine(inDir + "/x.wav", 0.5);
    writeTextFile(root + "/blocked_out", "a file where a directory should be");

    ProcessingConfig config;
    auto const report = runJobs(jobsFor(inDir, root + "/blocked_out", config), 1);

    check(report.failed == 1, __LINE__);
    check(report.failures.size() == 1 && report.failures[0].find("encode error") != std::string::npos, __LINE__);
}


static pthread_mutex_t countMtx = PTHREAD_MUTEX_INITIALIZER;
static std::vector<int> runCounts;

static JobOutcome countingRunner(FileJob const& job)
{
    auto const idx = static_cast<size_t>(std::stoi(job.sourcePath));

    {
        MutexLock lock(countMtx);
        ++runCounts[idx];
    }

    ::usleep(static_cast<useconds_t>((idx * 7919) % 2000));

    if (idx % 5 == 0)
        throw std::runtime_error("job " + job.sourcePath + " blew up");

    JobOutcome outcome;
    outcome.sourcePath = job.sourcePath;
    outcome.status     = idx % 3 == 0 ? JobStatus::Failed : JobStatus::Success;
    outcome.error      = outcome.status == JobStatus::Failed ? "synthetic failure" : "";
    return outcome;
}

static void testEveryJobExactlyOnce()
{
    ProcessingConfig config;
    std::vector<FileJob> jobs;
    for (int i = 0; i < 60; ++i)
        jobs.push_back({ std::to_string(i), "", &config });

    for (int32_t workers : { 1, 4, 16, 100 }) {
        runCounts.assign(jobs.size(), 0);
        auto const report = runJobs(jobs, workers, &countingRunner);

        check(report.totalJobs == 60, __LINE__);
        check(report.outcomes.size() == 60, __LINE__);
        check(std::all_of(runCounts.begin(), runCounts.end(), [](int n) { return n == 1; }), __LINE__);

        // multiples of 5 throw, other multiples of 3 fail: 12 + 16
        check(report.failed == 28, __LINE__);
        check(report.succeeded == 32, __LINE__);
        check(report.failures.size() == 28, __LINE__);
    }

    check(runJobs({}, 4).totalJobs == 0, __LINE__);
}

int main()
{
    auto const root = makeTempDir();

    testCorruptFileScenario(root);
    testOrderingAndWorkerIndependence(root);
    testSilentSourceIsSkipped(root);
    testSameStemNextToSources(root);
    testUnwritableDestination(root);
    testEveryJobExactlyOnce();

    removeTree(root);
    return testResult();
}
