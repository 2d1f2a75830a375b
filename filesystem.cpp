#include <algorithm>
#include <ctype.h>
#include <errno.h>
#include <iterator>
#include <limits>
#include <string.h>
#include <string>
#include <vector>

#if defined (__linux__) || defined (__linux) || defined (__gnu_linux__)
#include <dirent.h>
#include <limits.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <sys/types.h>
#else
#include <direct.h>
#include <windows.h>
#include <tchar.h>
#endif

#include "filesystem.hpp"
#include "log.hpp"

using std::string;
using std::vector;

// lower case
vector<string> const audioExtentions = { "wav", "wave", "flac", "mp3", "ogg", "aiff", "aif" };


static bool isSeparator(char c)
{
    return c == '/' || c == '\\';
}


#if defined (__linux__) || defined (__linux) || defined (__gnu_linux__)
static constexpr char const* separator = "/";

static bool pathType(char const* path, PathType& type)
{
    struct stat s;

    if (::stat(path, &s) != 0)
        return false;

    if (S_ISDIR(s.st_mode)) {
        type = PathType::Dir;
        return true;
    }
    if (S_ISREG(s.st_mode)) {
        type = PathType::File;
        return true;
    }

    return false; // sockets, fifos, devices
}

static string canonicalPath(string const& path)
{
    char realPath[PATH_MAX] = { 0, };

    if (char const* pth = ::realpath(path.c_str(), realPath))
        return pth;

    return {};
}

static bool makeDir(string const& dir)
{
    return ::mkdir(dir.c_str(), 0755) == 0 || errno == EEXIST;
}

// depth first, skips "." and ".." and anything that is neither a file nor a dir
static bool walkDir(string const& dir, PathNames& pathNames)
{
    DIR* dp = ::opendir(dir.c_str());

    if (!dp)
        return false;

    vector<string> subDirs;

    while (auto entry = ::readdir(dp)) {
        if (::strcmp(entry->d_name, ".") == 0 || ::strcmp(entry->d_name, "..") == 0)
            continue;

        auto const path = joinPath(dir, entry->d_name);
        PathType type;

        if (!pathType(path.c_str(), type))
            continue;

        pathNames.push_back({ type, path });

        if (type == PathType::Dir)
            subDirs.push_back(path);
    }

    ::closedir(dp);

    for (auto const& sub : subDirs) {
        if (!walkDir(sub, pathNames))
            logWarning("can't read directory " + sub + ": " + ::strerror(errno));
    }

    return true;
}
#else
static constexpr char const* separator = "\\";

static bool pathType(char const* path, PathType& type)
{
    DWORD const attrs = ::GetFileAttributes(path);

    if (attrs == INVALID_FILE_ATTRIBUTES)
        return false;

    type = (attrs & FILE_ATTRIBUTE_DIRECTORY) != 0 ? PathType::Dir : PathType::File;
    return true;
}

static string canonicalPath(string const& path)
{
    auto static const constexpr BUF_SZ = 4096;
    TCHAR buffer[BUF_SZ] = TEXT("");

    if (::GetFullPathName(path.c_str(), BUF_SZ, buffer, nullptr) == 0)
        return {};

    return buffer;
}

static bool makeDir(string const& dir)
{
    return ::_mkdir(dir.c_str()) == 0 || errno == EEXIST;
}

static bool walkDir(string const& dir, PathNames& pathNames)
{
    auto const pattern = dir + "\\*";
    WIN32_FIND_DATA ffd;
    HANDLE hFind = ::FindFirstFile(pattern.c_str(), &ffd);

    if (hFind == INVALID_HANDLE_VALUE)
        return false;

    vector<string> subDirs;

    do {
        if (::strcmp(ffd.cFileName, ".") == 0 || ::strcmp(ffd.cFileName, "..") == 0)
            continue;

        bool const isDir = (ffd.dwFileAttributes & FILE_ATTRIBUTE_DIRECTORY) != 0;
        auto path = joinPath(dir, ffd.cFileName);

        if (isDir)
            subDirs.push_back(path);

        pathNames.push_back({ isDir ? PathType::Dir : PathType::File, std::move(path) });
    } while (::FindNextFile(hFind, &ffd) != 0);

    bool const ok = ::GetLastError() == ERROR_NO_MORE_FILES;
    ::FindClose(hFind);

    if (!ok)
        logWarning("FindNextFile wrong status in " + dir);

    for (auto const& sub : subDirs) {
        if (!walkDir(sub, pathNames))
            logWarning("can't read directory " + sub);
    }

    return true;
}
#endif


string joinPath(string const& dir, string const& name)
{
    if (dir.empty())
        return name;

    if (isSeparator(dir.back()))
        return dir + name;

    return dir + separator + name;
}

string parentDir(string const& path)
{
    auto const pos = path.find_last_of("/\\");

    if (pos == string::npos)
        return ".";

    if (pos == 0)
        return path.substr(0, 1);

    return path.substr(0, pos);
}

bool isDirectory(string const& path)
{
    PathType type;
    return pathType(path.c_str(), type) && type == PathType::Dir;
}

// like "mkdir -p"
bool makeDirs(string const& dir)
{
    if (dir.empty() || isDirectory(dir))
        return true;

    for (size_t pos = 1; pos <= dir.size(); ++pos) {
        if (pos != dir.size() && !isSeparator(dir[pos]))
            continue;

        auto const prefix = dir.substr(0, pos);

        if (isSeparator(prefix.back()) || (prefix.size() == 2 && prefix[1] == ':'))
            continue;

        if (!makeDir(prefix))
            return false;
    }

    return isDirectory(dir);
}

PathNames getDirContentsRecursive(string const& dir)
{
    PathNames pathNames;

    if (!walkDir(dir, pathNames))
        throw ConfigError("can't read directory " + dir);

    return pathNames;
}


// filter set of files by their extentions
PathNames filterFiles(PathNames const& pathNames, vector<string> const& extentions)
{
    PathNames out;

    for (auto const& pathName : pathNames) {
        if (pathName.type != PathType::File)
            continue;

        auto const& name = pathName.name;

        for (auto const& extention : extentions) {
            if (name.size() < extention.size() + 1) // enough to contain '.' + extention
                continue;

            auto const extSize = static_cast<int32_t>(extention.size());
            if (extention.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max()))
                throw std::out_of_range("Extention size it too big!");

            if (*(name.rbegin() + extSize) != '.') // check extention has a '.'
                continue;

            string extentionAllLowerBackwards;
            std::transform(name.rbegin(), name.rbegin() + extSize,
                           std::back_inserter(extentionAllLowerBackwards),
                           [](char c) { return static_cast<char>(::tolower(static_cast<unsigned char>(c))); });

            bool const isEqualExtention = std::equal(
                        extentionAllLowerBackwards.rbegin(),
                        extentionAllLowerBackwards.rbegin() + extSize,
                        extention.begin());

            if (isEqualExtention) {
                out.push_back(pathName);
                break;
            }
        }
    }

    return out;
}


PathNames collectAudioFiles(string const& inputPath, string& baseDir)
{
    auto const root = canonicalPath(inputPath);
    PathType type;

    if (root.empty() || !pathType(root.c_str(), type))
        throw ConfigError("input path doesn't exist: " + inputPath);

    if (type == PathType::File) {
        baseDir = parentDir(root);
        return { { PathType::File, root } };
    }

    baseDir = root;
    auto files = filterFiles(getDirContentsRecursive(root), audioExtentions);

    std::sort(files.begin(), files.end(),
              [](PathName const& a, PathName const& b) { return a.name < b.name; });

    return files;
}


// stem (file name without directory and extention) of path
static string stemOf(string const& path)
{
    auto const sep  = path.find_last_of("/\\");
    auto const name = sep == string::npos ? path : path.substr(sep + 1);
    auto const dot  = name.find_last_of('.');

    return dot == string::npos ? name : name.substr(0, dot);
}

// lower case extention without the '.', empty if there is none
string extentionOfPath(string const& path)
{
    auto const dot = path.find_last_of('.');
    auto const sep = path.find_last_of("/\\");

    if (dot == string::npos || (sep != string::npos && dot < sep))
        return {};

    string ext = path.substr(dot + 1);
    for (auto& c : ext)
        c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));

    return ext;
}

bool isProcessedOutput(string const& path)
{
    static string const suffix = "_processed";
    auto const stem = stemOf(path);

    return stem.size() >= suffix.size()
        && stem.compare(stem.size() - suffix.size(), suffix.size(), suffix) == 0;
}


// mirror inFile's position under baseDir into outputRoot; without an output
// root the file lands next to its source as <stem><tag>_processed.<ext>
string buildOutputPath(string const& inFile, string const& baseDir,
                       string const& outputRoot, char const* extention,
                       string const& tag)
{
    if (outputRoot.empty()) {
        auto const sep = inFile.find_last_of("/\\");
        auto const dir = sep == string::npos ? string() : inFile.substr(0, sep + 1);

        return dir + stemOf(inFile) + tag + "_processed." + extention;
    }

    string relative = inFile;

    bool const underBase = !baseDir.empty()
                        && inFile.size() > baseDir.size()
                        && inFile.compare(0, baseDir.size(), baseDir) == 0
                        && (isSeparator(baseDir.back()) || isSeparator(inFile[baseDir.size()]));

    if (underBase) {
        relative = inFile.substr(baseDir.size());

        while (!relative.empty() && isSeparator(relative.front()))
            relative.erase(0, 1);
    }
    else {
        auto const sep = inFile.find_last_of("/\\");
        if (sep != string::npos)
            relative = inFile.substr(sep + 1);
    }

    auto const sep = relative.find_last_of("/\\");
    auto const dir = sep == string::npos ? string() : relative.substr(0, sep);

    return joinPath(joinPath(outputRoot, dir), stemOf(relative) + tag + "." + extention);
}
