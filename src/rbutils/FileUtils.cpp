// Copyright (C) 2016 iNuron NV
//
// This file is part of Open vStorage Open Source Edition (OSE),
// as available from
//
//      http://www.openvstorage.org and
//      http://www.openvstorage.com.
//
// This file is free software; you can redistribute it and/or modify it
// under the terms of the GNU Affero General Public License v3 (GNU AGPLv3)
// as published by the Free Software Foundation, in version 3 as it comes in
// the LICENSE.txt file of the Open vStorage OSE distribution.
// Open vStorage is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY of any kind.

#include "Assert.h"
#include "FileUtils.h"

#include <limits.h>
#include <stdlib.h>
#include <string.h>

#include <vector>

#include <boost/filesystem/fstream.hpp>

namespace rbutils
{

fs::path
FileUtils::temp_path()
{
    const char* tmp = getenv("TEMP");
    if (not tmp)
    {
        tmp = getenv("TMP");
    }
    if (not tmp)
    {
        tmp = "/tmp";
    }
    return fs::path(tmp);
}

fs::path
FileUtils::create_temp_dir(const fs::path& dir,
                           const std::string& name)
{
    const std::string tmp((dir / (name + "XXXXXX")).string());
    VERIFY(tmp.size() < PATH_MAX);

    std::vector<char> buf(tmp.begin(), tmp.end());
    buf.push_back('\0');

    const char* res = mkdtemp(buf.data());
    if (res == nullptr)
    {
        const int err = errno;
        LOG_ERROR("Failed to create temp dir " << tmp << ": " << strerror(err));
        throw FileUtilsException("Failed to create temp directory",
                                 tmp.c_str(),
                                 err);
    }

    return fs::path(res);
}

bool
FileUtils::is_empty_directory(const fs::path& p)
{
    if (not fs::exists(p))
    {
        return true;
    }

    if (not fs::is_directory(p))
    {
        LOG_ERROR(p << " is not a directory");
        throw FileUtilsException("Not a directory",
                                 p.string().c_str());
    }

    return fs::directory_iterator(p) == fs::directory_iterator();
}

void
FileUtils::touch(const fs::path& p)
{
    if (not fs::exists(p))
    {
        fs::ofstream f(p);
        if (not f)
        {
            LOG_ERROR("Failed to create " << p);
            throw FileUtilsException("Failed to create file",
                                     p.string().c_str());
        }
    }
}

void
FileUtils::replace_symlink(const fs::path& target,
                           const fs::path& link)
{
    const fs::path tmp(link.parent_path() / (link.filename().string() + ".new"));

    if (fs::symlink_status(tmp).type() != fs::file_not_found)
    {
        fs::remove(tmp);
    }

    fs::create_symlink(target,
                       tmp);
    fs::rename(tmp,
               link);
}

}

// Local Variables: **
// mode: c++ **
// End: **
