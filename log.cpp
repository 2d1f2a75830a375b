#include <fstream>
#include <iostream>
#include <time.h>
#include <pthread.h>

#include "batchaudio.hpp"
#include "log.hpp"

using std::cout;
using std::cerr;
using std::endl;

static pthread_mutex_t consoleMtx = PTHREAD_MUTEX_INITIALIZER;
static std::ofstream   debugLog;


static char const* levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:   return "DEBUG";
    case LogLevel::Info:    return "INFO";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error:   return "ERROR";
    }
    return "?";
}

// HH:MM:SS of the local wall clock
static std::string timestamp()
{
    char buf[16] = { 0, };
    time_t const now = ::time(nullptr);
    struct tm local;

#if defined (_WIN32)
    ::localtime_s(&local, &now);
#else
    ::localtime_r(&now, &local);
#endif

    ::strftime(buf, sizeof(buf), "%H:%M:%S", &local);
    return buf;
}

bool initLog(char const* debugLogPath)
{
    MutexLock lock(consoleMtx);

    if (debugLog.is_open())
        debugLog.close();

    if (!debugLogPath)
        return true;

    debugLog.open(debugLogPath, std::ios_base::out | std::ios_base::app);
    return debugLog.is_open();
}

void shutdownLog()
{
    MutexLock lock(consoleMtx);

    if (debugLog.is_open()) {
        debugLog.flush();
        debugLog.close();
    }
}

void logMessage(LogLevel level, std::string const& msg)
{
    auto const stamp = timestamp();
    MutexLock lock(consoleMtx);

    if (debugLog.is_open())
        debugLog << stamp << " | " << levelName(level) << " | " << msg << endl;

    if (level == LogLevel::Error)
        cerr << "ERROR! " << msg << endl; // cmd swallows "\n"s
    else if (level == LogLevel::Warning)
        cout << "WARNING: " << msg << endl;
    else if (level == LogLevel::Info)
        cout << msg << endl;
}
