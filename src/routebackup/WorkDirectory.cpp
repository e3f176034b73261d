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

#include "WorkDirectory.h"

#include <rbutils/FileUtils.h>

namespace routebackup
{

namespace fs = boost::filesystem;

namespace
{

fs::path
make_work_directory(const fs::path& scratch_root)
{
    fs::create_directories(scratch_root);
    return rbutils::FileUtils::create_temp_dir(scratch_root,
                                               "routebackup-");
}

}

WorkDirectory::WorkDirectory(const fs::path& scratch_root)
    : directory_(make_work_directory(scratch_root))
{
    LOG_INFO("Created work directory " << directory_);
}

WorkDirectory::~WorkDirectory()
{
    LOG_INFO("Cleaning up work directory " << directory_);

    boost::system::error_code ec;
    fs::remove_all(directory_,
                   ec);
    if (ec)
    {
        LOG_ERROR("Failed to remove work directory " << directory_ << ": " <<
                  ec.message());
    }
}

fs::path
WorkDirectory::newFile(const std::string& name) const
{
    const fs::path p(directory_ / name);
    if (fs::exists(p))
    {
        LOG_ERROR(p << " already exists");
        throw WorkDirectoryException("File exists",
                                     p.string().c_str());
    }

    return p;
}

}

// Local Variables: **
// mode: c++ **
// End: **
