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

#ifndef ROUTEBACKUP_WORK_DIRECTORY_H_
#define ROUTEBACKUP_WORK_DIRECTORY_H_

#include <string>

#include <boost/filesystem.hpp>

#include <rbutils/Exception.h>
#include <rbutils/Logging.h>

namespace routebackup
{

MAKE_EXCEPTION(WorkDirectoryException, rbutils::Exception);

// Private scratch space of one run (route dump, work lists). Created with a
// unique name below the scratch root and removed with everything in it on
// destruction.
class WorkDirectory
{
public:
    explicit WorkDirectory(const boost::filesystem::path& scratch_root);

    ~WorkDirectory();

    WorkDirectory(const WorkDirectory&) = delete;

    WorkDirectory&
    operator=(const WorkDirectory&) = delete;

    // Path for a new file in the work directory; throws if name is taken.
    boost::filesystem::path
    newFile(const std::string& name) const;

    const boost::filesystem::path&
    path() const
    {
        return directory_;
    }

private:
    DECLARE_LOGGER("WorkDirectory");

    const boost::filesystem::path directory_;
};

}

#endif // !ROUTEBACKUP_WORK_DIRECTORY_H_

// Local Variables: **
// mode: c++ **
// End: **
