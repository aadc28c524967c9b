/*
 *  Copyright (c) 2015, AirBitz, Inc.
 *  All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Debug.hpp"
#include "FileIO.hpp"
#include "../Context.hpp"
#include <stdarg.h>
#include <stdio.h>
#include <time.h>
#ifdef ANDROID
#include <android/log.h>
#endif
#include <mutex>
#include <vector>

namespace sidcore {

// Past this size the log moves aside to sid-prev.log:
static const long logSizeLimit = 512 * 1024;

static std::mutex gLogMutex;
static FILE *gLogFile = nullptr;

#ifdef DEBUG
/**
 * Moves the current log aside and opens a fresh one.
 * The caller must hold gLogMutex.
 */
static Status
logFileRotate()
{
    if (gLogFile)
        fclose(gLogFile);
    gLogFile = nullptr;

    const auto path = gContext->rootDir() + "sid.log";
    const auto prevPath = gContext->rootDir() + "sid-prev.log";
    if (fileExists(path) && rename(path.c_str(), prevPath.c_str()))
        return SID_ERROR(SID_CC_SysError, "Cannot move " + path + " aside");

    gLogFile = fopen(path.c_str(), "w");
    if (!gLogFile)
        return SID_ERROR(SID_CC_SysError, "Cannot open " + path);
    return Status();
}

static std::string
logTimestamp()
{
    const time_t now = time(nullptr);
    struct tm utc;
    gmtime_r(&now, &utc);

    char out[32];
    strftime(out, sizeof(out), "%Y-%m-%d %H:%M:%S", &utc);
    return out;
}

static void
logWrite(const std::string &line)
{
#ifdef ANDROID
    __android_log_print(ANDROID_LOG_DEBUG, "SID", "%s", line.c_str());
#else
    fputs(line.c_str(), stderr);
#endif

    std::lock_guard<std::mutex> lock(gLogMutex);
    if (!gLogFile)
        return;

    if (logSizeLimit < ftell(gLogFile))
    {
        // SID_DebugLog would deadlock here, so report straight to stderr:
        Status s = logFileRotate();
        if (!s)
        {
            fprintf(stderr, "%s\n", s.message().c_str());
            return;
        }
    }

    fputs(line.c_str(), gLogFile);
    fflush(gLogFile);
}
#endif

Status
debugInitialize()
{
#ifdef DEBUG
    if (!gContext)
        return SID_ERROR(SID_CC_NotInitialized, "No context for the log file");

    std::lock_guard<std::mutex> lock(gLogMutex);
    SID_CHECK(logFileRotate());
#endif

    return Status();
}

void
debugTerminate()
{
    std::lock_guard<std::mutex> lock(gLogMutex);
    if (gLogFile)
        fclose(gLogFile);
    gLogFile = nullptr;
}

void SID_DebugLog(const char *format, ...)
{
#ifdef DEBUG
    va_list args;
    va_start(args, format);
    va_list sizing;
    va_copy(sizing, args);
    const int size = vsnprintf(nullptr, 0, format, sizing);
    va_end(sizing);
    if (size < 0)
    {
        va_end(args);
        return;
    }

    std::vector<char> message(size + 1);
    vsnprintf(message.data(), message.size(), format, args);
    va_end(args);

    std::string line = logTimestamp() + " SID_Log: " + message.data();
    if (line.empty() || '\n' != line[line.size() - 1])
        line += '\n';
    logWrite(line);
#else
    (void)format;
#endif
}

} // namespace sidcore
