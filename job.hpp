#ifndef JOB_H
#define JOB_H

#include "batchaudio.hpp"
#include "filesystem.hpp"

enum class JobStage : uint8_t { Pending, Decoding, Trimming, Normalizing, Converting, Encoding, Done, Failed };

char const* stageName(JobStage stage);

// one job per discovered file, destinations mirrored from baseDir into outputRoot.
// A destination never equals a source or another job's destination, and
// without an output root earlier "_processed" outputs are left out
std::vector<FileJob> buildJobs(PathNames const& files, std::string const& baseDir,
                               std::string const& outputRoot, ProcessingConfig const& config);

// decode -> trim -> normalize -> convert -> encode, never throws:
// every failure ends up in the returned outcome
JobOutcome runFileJob(FileJob const& job);

#endif // JOB_H
