// Copyright (C) 2015 Acrosync LLC
//
// Unless explicitly acquired and licensed from Licensor under another
// license, the contents of this file are subject to the Reciprocal Public
// License ("RPL") Version 1.5, or subsequent versions as allowed by the RPL,
// and You may not copy or use this file in either source code or executable
// form, except in compliance with the terms and conditions of the RPL.
//
// All software distributed under the RPL is provided strictly on an "AS
// IS" basis, WITHOUT WARRANTY OF ANY KIND, EITHER EXPRESS OR IMPLIED, AND
// LICENSOR HEREBY DISCLAIMS ALL SUCH WARRANTIES, INCLUDING WITHOUT
// LIMITATION, ANY WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
// PURPOSE, QUIET ENJOYMENT, OR NON-INFRINGEMENT. See the RPL for specific
// language governing rights and limitations under the RPL. 

#include <replica/replica_pathutil.h>

#include <replica/replica_log.h>

#include <sys/stat.h>
#include <sys/types.h>
#include <dirent.h>
#include <errno.h>
#include <string.h>
#include <unistd.h>

#include <cstdio>

namespace replica
{

std::string PathUtil::join(const char *top, const char *path)
{
    std::string fullPath = top;
    size_t length = fullPath.size();
    if (length && fullPath[length - 1] != '/') {
        fullPath += "/";
    }
    fullPath += path;
    return fullPath;
}

std::string PathUtil::getDirectory(const char *fullPath)
{
    const char *pos = strrchr(fullPath, '/');
    if (pos) {
        return std::string(fullPath, pos - fullPath);
    } else {
        return std::string("");
    }
}

bool PathUtil::createDirectories(const char *fullPath)
{
    if (isDirectory(fullPath)) {
        return true;
    }

    std::string parent = getDirectory(fullPath);
    if (!parent.empty() && parent != fullPath && !createDirectories(parent.c_str())) {
        return false;
    }

    if (!createDirectory(fullPath) && !isDirectory(fullPath)) {
        LOG_ERROR(PATH_MKDIR) << "Failed to create the directory '" << fullPath << "': " << strerror(errno)
                              << LOG_END
        return false;
    }
    return true;
}

bool PathUtil::listDirectory(const char *fullPath, std::vector<std::string> *names)
{
    DIR *dir = opendir(fullPath);
    if (!dir) {
        LOG_ERROR(PATH_LIST) << "Failed to list the directory '" << fullPath << "': " << strerror(errno) << LOG_END
        return false;
    }

    struct dirent *entry;
    while ((entry = readdir(dir)) != 0) {
        if (strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, "..") == 0) {
            continue;
        }
        names->push_back(entry->d_name);
    }
    closedir(dir);
    return true;
}

void PathUtil::removeDirectoryRecursively(const char *fullPath)
{
    std::vector<std::string> names;
    if (!listDirectory(fullPath, &names)) {
        return;
    }

    for (size_t i = 0; i < names.size(); ++i) {
        std::string path = join(fullPath, names[i].c_str());
        if (isDirectory(path.c_str())) {
            removeDirectoryRecursively(path.c_str());
        } else {
            remove(path.c_str());
        }
    }

    if (::rmdir(fullPath) != 0) {
        LOG_ERROR(PATH_REMOVE) << "Failed to remove the directory '" << fullPath << "': " << strerror(errno)
                               << LOG_END
    }
}

bool PathUtil::exists(const char *fullPath)
{
    struct stat buf;
    return stat(fullPath, &buf) == 0;
}

bool PathUtil::remove(const char *fullPath, bool enableLogging)
{
    if (::remove(fullPath) != 0 && errno != ENOENT) {
        if (enableLogging) {
            LOG_ERROR(PATH_REMOVE) << "Failed to remove '" << fullPath << "': " << strerror(errno) << LOG_END
        }
        return false;
    }
    return true;
}

bool PathUtil::rename(const char *from, const char *to, bool enableLogging)
{
    if (::rename(from, to) != 0) {
        if (enableLogging) {
            LOG_ERROR(PATH_RENAME) << "Failed to rename '" << from << "' to '" << to << "': " << strerror(errno)
                                   << LOG_END
        }
        return false;
    }
    return true;
}

bool PathUtil::isDirectory(const char *fullPath)
{
    struct stat buf;
    if (stat(fullPath, &buf) != 0){
        return false;
    }
    return S_ISDIR(buf.st_mode);
}

bool PathUtil::createDirectory(const char *fullPath)
{
    return mkdir(fullPath, 0700) == 0;
}

std::string PathUtil::getCurrentDirectory()
{
    char buffer[1024];
    if (getcwd(buffer, sizeof(buffer)) == buffer) {
        return buffer;
    } else {
        return "";
    }
}

} // close namespace replica
