#ifndef FILESYSTEM_H
#define FILESYSTEM_H

#include "batchaudio.hpp"

using PathNames = std::vector<PathName>;

PathNames filterFiles(PathNames const& pathNames, std::vector<std::string> const& extentions);
PathNames getDirContentsRecursive(std::string const& dir);

// file or directory -> sorted list of audio files, baseDir receives the
// directory the outputs are mirrored from; throws ConfigError
PathNames collectAudioFiles(std::string const& inputPath, std::string& baseDir);

// tag goes between the file's stem and its new extention
std::string buildOutputPath(std::string const& inFile, std::string const& baseDir,
                            std::string const& outputRoot, char const* extention,
                            std::string const& tag = "");

// outputs written without an output root end in "_processed"
bool isProcessedOutput(std::string const& path);

std::string extentionOfPath(std::string const& path);
std::string parentDir(std::string const& path);
std::string joinPath(std::string const& dir, std::string const& name);
bool makeDirs(std::string const& dir);
bool isDirectory(std::string const& path);

extern std::vector<std::string> const audioExtentions;

#endif // FILESYSTEM_H
