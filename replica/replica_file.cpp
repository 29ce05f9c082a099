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

#include <replica/replica_file.h>

#include <replica/replica_log.h>
#include <replica/replica_pathutil.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <errno.h>
#include <string.h>

namespace replica
{

File::Handle File::InvalidHandle = -1;

File::File()
    : d_handle(InvalidHandle)
    , d_path("")
{
}

File::File(const char *fullPath, bool forWrite, bool reportError)
    : d_handle(InvalidHandle)
    , d_path(fullPath)
{
    open(fullPath, forWrite, reportError);
}

bool File::open(const char *fullPath, bool forWrite, bool reportError)
{
    close();
    d_path = fullPath;
    if (forWrite) {
        d_handle = ::open(fullPath, O_WRONLY | O_CREAT | O_TRUNC, S_IRUSR | S_IWUSR);
    } else {
        d_handle = ::open(fullPath, O_RDONLY);
    }

    if (d_handle == InvalidHandle && reportError) {
        LOG_ERROR(FILE_OPEN) << "Failed to open '" << fullPath << "': " << strerror(errno) << LOG_END
    }
    return d_handle != InvalidHandle;
}

File::~File()
{
    this->close();
}

int File::read(char *buffer, int size)
{
    if (d_handle == InvalidHandle) {
        return -1;
    }

    int rc;
    do {
        rc = static_cast<int>(::read(d_handle, buffer, size));
    } while (rc == -1 && errno == EINTR);

    if (rc == -1) {
        LOG_ERROR(FILE_READ) << "Error reading from '" << d_path << "': " << strerror(errno) << LOG_END
    }
    return rc;
}

int File::write(const char *buffer, int size)
{
    if (d_handle == InvalidHandle) {
        return -1;
    }

    int bytes = 0;
    while (bytes < size) {
        int rc = static_cast<int>(::write(d_handle, buffer + bytes, size - bytes));
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR(FILE_WRITE) << "Error writing to '" << d_path << "': " << strerror(errno) << LOG_END
            return -1;
        }
        bytes += rc;
    }
    return bytes;
}

bool File::sync()
{
    if (d_handle == InvalidHandle) {
        return false;
    }
    if (::fsync(d_handle) != 0) {
        LOG_ERROR(FILE_SYNC) << "Failed to flush '" << d_path << "': " << strerror(errno) << LOG_END
        return false;
    }
    return true;
}

void File::close()
{
    if (d_handle == InvalidHandle) {
        return;
    }
    ::close(d_handle);
    d_handle = InvalidHandle;
}

bool File::readContents(const char *fullPath, std::string *contents)
{
    File file(fullPath, false, true);
    if (!file.isValid()) {
        return false;
    }

    contents->clear();
    char buffer[65536];
    for (;;) {
        int rc = file.read(buffer, sizeof(buffer));
        if (rc < 0) {
            return false;
        }
        if (rc == 0) {
            break;
        }
        contents->append(buffer, rc);
    }
    return true;
}

bool File::writeContents(const char *fullPath, const std::string &contents)
{
    std::string temporaryPath = std::string(fullPath) + ".tmp";
    {
        File file(temporaryPath.c_str(), true, true);
        if (!file.isValid()) {
            return false;
        }
        if (file.write(contents.data(), static_cast<int>(contents.size())) != static_cast<int>(contents.size()) ||
            !file.sync()) {
            file.close();
            PathUtil::remove(temporaryPath.c_str());
            return false;
        }
    }
    if (!PathUtil::rename(temporaryPath.c_str(), fullPath)) {
        PathUtil::remove(temporaryPath.c_str(), false);
        return false;
    }
    return true;
}

} // close namespace replica
