#include <ctype.h>
#include <exception>
#include <set>
#include <string>

#include "codec.hpp"
#include "convert.hpp"
#include "job.hpp"
#include "log.hpp"
#include "loudness.hpp"
#include "trim.hpp"

using std::string;

char const* stageName(JobStage stage)
{
    switch (stage) {
    case JobStage::Pending:     return "pending";
    case JobStage::Decoding:    return "decoding";
    case JobStage::Trimming:    return "trimming";
    case JobStage::Normalizing: return "normalizing";
    case JobStage::Converting:  return "converting";
    case JobStage::Encoding:    return "encoding";
    case JobStage::Done:        return "done";
    case JobStage::Failed:      return "failed";
    }
    return "?";
}

// collision key, case-insensitive file systems included
static string pathKey(string path)
{
    for (auto& c : path)
        c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    return path;
}

std::vector<FileJob> buildJobs(PathNames const& files, string const& baseDir,
                               string const& outputRoot, ProcessingConfig const& config)
{
    auto const extention = extentionOf(config.outputFormat);
    std::vector<FileJob> jobs;
    std::set<string> taken;

    jobs.reserve(files.size());

    for (auto const& file : files) {
        if (!outputRoot.empty() || !isProcessedOutput(file.name))
            taken.insert(pathKey(file.name));
    }

    for (auto const& file : files) {
        if (outputRoot.empty() && isProcessedOutput(file.name)) {
            logInfo("skipping earlier output " + file.name);
            continue;
        }

        auto dest = buildOutputPath(file.name, baseDir, outputRoot, extention);

        // song.wav and song.flac must not share song.wav, nor replace a source
        if (taken.count(pathKey(dest))) {
            auto const tag = "_" + extentionOfPath(file.name);
            dest = buildOutputPath(file.name, baseDir, outputRoot, extention, tag);

            for (int n = 2; taken.count(pathKey(dest)); ++n)
                dest = buildOutputPath(file.name, baseDir, outputRoot, extention, tag + "_" + std::to_string(n));
        }

        taken.insert(pathKey(dest));
        jobs.push_back({ file.name, std::move(dest), &config });
    }

    return jobs;
}

static void enter(FileJob const& job, JobStage& stage, JobStage next)
{
    stage = next;
    logDebug(job.sourcePath + ": " + stageName(next));
}

static JobOutcome fail(JobOutcome outcome, JobStage stage, char const* kind, char const* what)
{
    outcome.status = JobStatus::Failed;
    outcome.error  = string(kind) + " while " + stageName(stage) + ": " + what;
    logDebug(outcome.sourcePath + ": " + stageName(JobStage::Failed));
    return outcome;
}

JobOutcome runFileJob(FileJob const& job)
{
    JobOutcome outcome;
    outcome.sourcePath = job.sourcePath;
    outcome.destPath   = job.destPath;

    JobStage stage = JobStage::Pending;

    if (!job.config)
        return fail(outcome, stage, "config error", "job has no configuration");

    ProcessingConfig const& config = *job.config;

    try {
        enter(job, stage, JobStage::Decoding);
        SampleBuffer buffer = decodeFile(job.sourcePath);
        logDebug(job.sourcePath + ": decoded " + describeBuffer(buffer));

        if (config.trimSilence) {
            enter(job, stage, JobStage::Trimming);
            auto const before = buffer.frames();
            buffer = trimSilence(buffer, config.silenceThreshDb);
            logDebug(job.sourcePath + ": trimmed " + std::to_string(before - buffer.frames()) + " frames");

            if (buffer.frames() == 0) {
                outcome.status = JobStatus::Skipped;
                outcome.error  = "source is entirely silent";
                return outcome;
            }
        }

        if (config.normalize) {
            enter(job, stage, JobStage::Normalizing);
            buffer = normalizeLoudness(buffer, config.targetLufs);
        }

        enter(job, stage, JobStage::Converting);
        auto const targetRate = config.targetSampleRate > 0 ? config.targetSampleRate : buffer.sampleRate;
        buffer = convertFormat(buffer, targetRate, config.targetBitDepth);

        enter(job, stage, JobStage::Encoding);
        auto const destDir = parentDir(job.destPath);
        if (!makeDirs(destDir))
            throw EncodeError("can't create directory " + destDir);

        encodeFile(buffer, job.destPath, config.outputFormat);
        enter(job, stage, JobStage::Done);
    }
    catch (DecodeError const& e) {
        return fail(outcome, stage, "decode error", e.what());
    }
    catch (TransformError const& e) {
        return fail(outcome, stage, "transform error", e.what());
    }
    catch (EncodeError const& e) {
        return fail(outcome, stage, "encode error", e.what());
    }
    catch (std::exception const& e) {
        return fail(outcome, stage, "error", e.what());
    }

    outcome.status = JobStatus::Success;
    return outcome;
}
