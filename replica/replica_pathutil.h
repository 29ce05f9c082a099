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

#ifndef INCLUDED_REPLICA_PATHUTIL_H
#define INCLUDED_REPLICA_PATHUTIL_H

#include <string>
#include <vector>

namespace replica
{

struct PathUtil
{
    // Common file/dir operations.
    static bool exists(const char *fullPath);
    static bool remove(const char *fullPath, bool enableLogging = true);
    static bool rename(const char *from, const char *to, bool enableLogging = true);
    static bool isDirectory(const char *fullPath);
    static bool createDirectory(const char *fullPath);

    // Concatenate two paths.
    static std::string join(const char *top, const char *path);

    // Return the directory part of the path
    static std::string getDirectory(const char *fullPath);

    // Create 'fullPath' and any missing parent directories.
    static bool createDirectories(const char *fullPath);

    // Append the names of the entries in the directory, except '.' and '..'.
    static bool listDirectory(const char *fullPath, std::vector<std::string> *names);

    // Remove a directory and all its contents, recursively
    static void removeDirectoryRecursively(const char *fullPath);

    static std::string getCurrentDirectory();
};

} // close namespace replica

#endif // INCLUDED_REPLICA_PATHUTIL_H
