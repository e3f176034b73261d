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

#include "SnapshotLayout.h"

#include <boost/date_time/posix_time/posix_time.hpp>

#include <rbutils/FileUtils.h>

namespace routebackup
{

namespace bpt = boost::posix_time;
namespace fs = boost::filesystem;

using rbutils::FileUtils;

SnapshotLayout::SnapshotLayout(const fs::path& root)
    : root_(root)
{}

std::string
SnapshotLayout::timestamp_name()
{
    return bpt::to_iso_string(bpt::second_clock::universal_time());
}

fs::path
SnapshotLayout::storage_directory(const fs::path& snapshot)
{
    return snapshot / "storage";
}

fs::path
SnapshotLayout::node_directory(const fs::path& snapshot,
                               const NodeId& node)
{
    return storage_directory(snapshot) / node.str();
}

boost::optional<fs::path>
SnapshotLayout::current_snapshot() const
{
    const fs::path link(current_link());

    if (not fs::is_symlink(link))
    {
        if (fs::exists(link))
        {
            LOG_ERROR(link << " exists but is not a symlink");
            throw SnapshotLayoutException("current is not a symlink",
                                          link.string().c_str());
        }
        return boost::none;
    }

    if (not fs::is_directory(link))
    {
        LOG_WARN(link << " is dangling, ignoring it");
        return boost::none;
    }

    return fs::canonical(link);
}

fs::path
SnapshotLayout::create_snapshot(const std::string& name) const
{
    if (name.empty() or
        name == current_name() or
        name.find('/') != std::string::npos)
    {
        throw SnapshotLayoutException("Invalid snapshot name",
                                      name.c_str());
    }

    fs::create_directories(root_);

    const fs::path p(root_ / name);
    if (not fs::create_directory(p))
    {
        LOG_ERROR("Snapshot " << p << " already exists");
        throw SnapshotLayoutException("Snapshot already exists",
                                      p.string().c_str());
    }

    fs::create_directory(storage_directory(p));

    LOG_INFO("Created snapshot " << p);
    return p;
}

boost::optional<fs::path>
SnapshotLayout::baseline_for(const NodeId& node) const
{
    const boost::optional<fs::path> current(current_snapshot());
    if (not current)
    {
        return boost::none;
    }

    const fs::path p(node_directory(*current,
                                    node));

    if (not fs::is_directory(p) or FileUtils::is_empty_directory(p))
    {
        LOG_INFO(node << ": no usable baseline in " << *current);
        return boost::none;
    }

    return p;
}

void
SnapshotLayout::promote(const fs::path& snapshot) const
{
    if (not fs::is_directory(snapshot) or
        not fs::equivalent(snapshot.parent_path(),
                           root_))
    {
        LOG_ERROR(snapshot << " is not a snapshot below " << root_);
        throw SnapshotLayoutException("Not a snapshot",
                                      snapshot.string().c_str());
    }

    // relative to the snapshot root
    FileUtils::replace_symlink(snapshot.filename(),
                               current_link());

    LOG_INFO(current_link() << " now points to " << snapshot.filename());
}

}

// Local Variables: **
// mode: c++ **
// End: **
