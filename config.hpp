#ifndef CONFIG_H
#define CONFIG_H

#include <ostream>

#include "batchaudio.hpp"

struct CommandLine
{
    std::string      inputPath;
    std::string      outputDir; // empty: outputs next to their sources
    bool             debug = false;
    bool             help  = false;
    ProcessingConfig config;
};

// throws ConfigError on anything it doesn't understand
CommandLine parseCommandLine(int argNum, char const* const* args);

// throws ConfigError, checked before any job is built
void validateConfig(ProcessingConfig const& config);

void printUsage(std::ostream& out);

#endif // CONFIG_H
