// Batch converter / trimmer / loudness normalizer for audio file trees
//   (1) called with a file or a folder, e.g.
//     batchaudio ~/Music -o ~/Processed -t -n -j 4
//     every supported file below that folder is processed, the folder
//     structure is mirrored into the output directory
//   (2) per file: decode, trim silence, normalize loudness, resample and
//     requantize, encode as WAV, FLAC or MP3
//   (3) -j N spreads the files over N POSIX threads, one file per worker at a time
//   (4) a broken file is reported and skipped, it never stops the batch
//   (5) exit code is 0 only if every file was processed

#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "batchaudio.hpp"
#include "config.hpp"
#include "filesystem.hpp"
#include "job.hpp"
#include "log.hpp"
#include "scheduler.hpp"

using std::cout;
using std::cerr;
using std::endl;

static constexpr char const* DEBUG_LOG = "batchaudio.debug.log";


static void printExtentionsMsg()
{
    cout << "Supported file extentions: ";
    for (auto const& ext : audioExtentions)
        cout << '.' << ext << " ";
    cout << "\n";
}

static void printReport(BatchReport const& report)
{
    if (report.failed > 0) {
        cerr << "\nFinished with " << report.failed << " error(s):\n";
        for (auto const& failure : report.failures)
            cerr << "  - " << failure << "\n";
    }
    else {
        cout << "\nAll " << report.succeeded << " file(s) processed successfully!\n";
    }

    if (report.skipped > 0)
        cout << report.skipped << " file(s) skipped\n";

    cout << report.succeeded << " of " << report.totalJobs << " file(s) written" << endl;
}


int main(int argNum, char** args)
{
    CommandLine cmd;

    try {
        cmd = parseCommandLine(argNum, args);
    }
    catch (ConfigError const& e) {
        cerr << "ERROR! " << e.what() << "\n\n";
        printUsage(cerr);
        return -1;
    }

    if (cmd.help) {
        printUsage(cout);
        printExtentionsMsg();
        return 0;
    }

    if (!initLog(cmd.debug ? DEBUG_LOG : nullptr))
        cerr << "WARNING: can't open " << DEBUG_LOG << ", debug log disabled" << endl;

    auto& config = cmd.config;
    std::string baseDir;
    PathNames files;

    try {
        files = collectAudioFiles(cmd.inputPath, baseDir);
    }
    catch (ConfigError const& e) {
        logError(e.what());
        shutdownLog();
        return -1;
    }

    if (files.empty()) {
        logError("No supported audio files found in " + cmd.inputPath);
        printExtentionsMsg();
        shutdownLog();
        return -1;
    }

    if (!cmd.outputDir.empty() && !makeDirs(cmd.outputDir)) {
        logError("can't create output directory " + cmd.outputDir);
        shutdownLog();
        return -1;
    }

    auto const cores = static_cast<int32_t>(std::thread::hardware_concurrency());
    if (cores > 0 && config.jobCount > cores) {
        logDebug("jobs capped from " + std::to_string(config.jobCount) + " to " + std::to_string(cores));
        config.jobCount = cores;
    }

    auto const jobs = buildJobs(files, baseDir, cmd.outputDir, config);

    logInfo("Found " + std::to_string(jobs.size()) + " files to process with "
            + std::to_string(config.jobCount) + " worker(s)");

    auto const report = runJobs(jobs, config.jobCount);

    printReport(report);
    shutdownLog();
    return report.failed == 0 ? 0 : 1;
}
