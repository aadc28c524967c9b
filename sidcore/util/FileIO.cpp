/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "FileIO.hpp"
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>

namespace sidcore {

std::recursive_mutex gFileMutex;

std::string
fileSlashify(const std::string &path)
{
    if (path.empty())
        return "./";
    return path.back() == '/' ? path : path + '/';
}

Status
fileEnsureDir(const std::string &dir)
{
    AutoFileLock lock(gFileMutex);

    if (!fileExists(dir))
    {
        mode_t process_mask = umask(0);
        int e = mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IRWXO);
        umask(process_mask);

        if (e)
            return SID_ERROR(SID_CC_SysError, "Could not create directory " + dir);
    }

    return Status();
}

bool
fileExists(const std::string &path)
{
    AutoFileLock lock(gFileMutex);

    return 0 == access(path.c_str(), F_OK);
}

} // namespace sidcore
