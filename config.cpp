#include <cmath>
#include <ctype.h>
#include <string.h>
#include <string>

#include "config.hpp"

using std::string;

static int32_t toInt(string const& option, char const* value)
{
    size_t used = 0;
    long parsed = 0;

    try {
        parsed = std::stol(value, &used);
    }
    catch (std::exception const&) {
        throw ConfigError("invalid integer for " + option + ": '" + value + "'");
    }

    if (used != ::strlen(value) || parsed < INT32_MIN || parsed > INT32_MAX)
        throw ConfigError("invalid integer for " + option + ": '" + value + "'");

    return static_cast<int32_t>(parsed);
}

static double toDouble(string const& option, char const* value)
{
    size_t used = 0;
    double parsed = 0.0;

    try {
        parsed = std::stod(value, &used);
    }
    catch (std::exception const&) {
        throw ConfigError("invalid number for " + option + ": '" + value + "'");
    }

    if (used != ::strlen(value))
        throw ConfigError("invalid number for " + option + ": '" + value + "'");

    return parsed;
}

static BitDepth toBitDepth(char const* value)
{
    string const v = value;

    if (v == "16") return BitDepth::Pcm16;
    if (v == "24") return BitDepth::Pcm24;
    if (v == "32") return BitDepth::Pcm32;

    throw ConfigError("bit depth must be 16, 24 or 32, got '" + v + "'");
}

static OutputFormat toOutputFormat(char const* value)
{
    string v = value;
    for (auto& c : v)
        c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));

    if (v == "wav")  return OutputFormat::Wav;
    if (v == "flac") return OutputFormat::Flac;
    if (v == "mp3")  return OutputFormat::Mp3;

    throw ConfigError("unknown output format '" + string(value) + "'");
}


CommandLine parseCommandLine(int argNum, char const* const* args)
{
    CommandLine cmd;
    auto& cfg = cmd.config;

    for (int i = 1; i < argNum; ++i) {
        string const arg = args[i];

        auto value = [&]() -> char const* {
            if (i + 1 >= argNum)
                throw ConfigError("option " + arg + " needs a value");
            return args[++i];
        };

        if (arg == "-h" || arg == "--help")
            cmd.help = true;
        else if (arg == "-o" || arg == "--output-dir")
            cmd.outputDir = value();
        else if (arg == "-r" || arg == "--sample-rate")
            cfg.targetSampleRate = toInt(arg, value());
        else if (arg == "-b" || arg == "--bit-depth")
            cfg.targetBitDepth = toBitDepth(value());
        else if (arg == "-f" || arg == "--format")
            cfg.outputFormat = toOutputFormat(value());
        else if (arg == "-t" || arg == "--trim-silence")
            cfg.trimSilence = true;
        else if (arg == "-n" || arg == "--normalize")
            cfg.normalize = true;
        else if (arg == "--target-lufs")
            cfg.targetLufs = toDouble(arg, value());
        else if (arg == "--silence-thresh")
            cfg.silenceThreshDb = toDouble(arg, value());
        else if (arg == "-j" || arg == "--jobs")
            cfg.jobCount = toInt(arg, value());
        else if (arg == "--debug")
            cmd.debug = true;
        else if (arg.size() > 1 && arg[0] == '-')
            throw ConfigError("unknown option " + arg);
        else if (cmd.inputPath.empty())
            cmd.inputPath = arg;
        else
            throw ConfigError("more than one input path given: " + arg);
    }

    if (cmd.help)
        return cmd;

    if (cmd.inputPath.empty())
        throw ConfigError("input path not specified");

    validateConfig(cfg);
    return cmd;
}

void validateConfig(ProcessingConfig const& config)
{
    if (config.targetSampleRate < 0)
        throw ConfigError("sample rate can't be negative");

    if (config.targetBitDepth != BitDepth::Pcm16
     && config.targetBitDepth != BitDepth::Pcm24
     && config.targetBitDepth != BitDepth::Pcm32)
        throw ConfigError("bit depth must be 16, 24 or 32");

    if (config.outputFormat == OutputFormat::Flac && config.targetBitDepth == BitDepth::Pcm32)
        throw ConfigError("FLAC output supports 16 and 24 bit only");

    if (!std::isfinite(config.targetLufs))
        throw ConfigError("target loudness must be a finite number");

    if (!std::isfinite(config.silenceThreshDb) || config.silenceThreshDb < 0.0)
        throw ConfigError("silence threshold must be a positive dB value");

    if (config.jobCount < 1)
        throw ConfigError("number of jobs must be at least 1");
}

void printUsage(std::ostream& out)
{
    out << "Usage: batchaudio INPUT_PATH [options]\n"
           "Batch convert / trim / normalize audio files.\n"
           "\n"
           "  -o, --output-dir DIR     output directory, mirrors the input tree\n"
           "                           (default: <name>_processed next to the sources)\n"
           "  -r, --sample-rate HZ     target sample rate, 0 keeps the source rate [44100]\n"
           "  -b, --bit-depth N        target bit depth: 16, 24 or 32 [16]\n"
           "  -f, --format FMT         output format: wav, flac or mp3 [wav]\n"
           "  -t, --trim-silence       trim leading/trailing silence\n"
           "  -n, --normalize          normalize loudness to the target LUFS\n"
           "      --target-lufs X      target loudness in LUFS [-12.0]\n"
           "      --silence-thresh DB  silence threshold in dB below full scale [60]\n"
           "  -j, --jobs N             parallel workers, >= 2 enables the pool [1]\n"
           "      --debug              write debug log to batchaudio.debug.log\n"
           "  -h, --help               show this message\n";
}
