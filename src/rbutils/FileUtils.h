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

#ifndef RBUTILS_FILE_UTILS_H_
#define RBUTILS_FILE_UTILS_H_

#include "Exception.h"
#include "Logging.h"

#include <string>

#include <boost/filesystem.hpp>

namespace rbutils
{

namespace fs = boost::filesystem;

MAKE_EXCEPTION(FileUtilsException, Exception);

struct FileUtils
{
    DECLARE_LOGGER("FileUtils");

    // $TEMP, $TMP or /tmp
    static fs::path
    temp_path();

    // mkdtemp(3) in dir; the returned directory exists and is unique.
    static fs::path
    create_temp_dir(const fs::path& dir,
                    const std::string& name);

    // A missing path counts as empty.
    static bool
    is_empty_directory(const fs::path& p);

    static void
    touch(const fs::path& p);

    // Replaces link (if any) with a symlink to target without a window in
    // which link does not exist.
    static void
    replace_symlink(const fs::path& target,
                    const fs::path& link);
};

}

#endif // !RBUTILS_FILE_UTILS_H_

// Local Variables: **
// mode: c++ **
// End: **
