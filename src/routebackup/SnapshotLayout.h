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

#ifndef ROUTEBACKUP_SNAPSHOT_LAYOUT_H_
#define ROUTEBACKUP_SNAPSHOT_LAYOUT_H_

#include "Types.h"

#include <string>

#include <boost/filesystem.hpp>
#include <boost/optional.hpp>

#include <rbutils/Exception.h>
#include <rbutils/Logging.h>

namespace routebackup
{

MAKE_EXCEPTION(SnapshotLayoutException, rbutils::Exception);

// The backup target:
//
//   <root>/<snapshot>/storage/<node>/<object path>
//   <root>/current -> <snapshot>
//
// current always names the most recent snapshot in which every node transfer
// succeeded and is the reuse baseline for the next run.
class SnapshotLayout
{
public:
    explicit SnapshotLayout(const boost::filesystem::path& root);

    ~SnapshotLayout() = default;

    SnapshotLayout(const SnapshotLayout&) = default;

    SnapshotLayout&
    operator=(const SnapshotLayout&) = delete;

    static std::string
    timestamp_name();

    static const std::string&
    current_name()
    {
        static const std::string n("current");
        return n;
    }

    static boost::filesystem::path
    storage_directory(const boost::filesystem::path& snapshot);

    static boost::filesystem::path
    node_directory(const boost::filesystem::path& snapshot,
                   const NodeId& node);

    const boost::filesystem::path&
    root() const
    {
        return root_;
    }

    boost::filesystem::path
    current_link() const
    {
        return root_ / current_name();
    }

    // The snapshot current points to, if any.
    boost::optional<boost::filesystem::path>
    current_snapshot() const;

    // Creates <root>/<name>/storage; throws if the snapshot already exists.
    boost::filesystem::path
    create_snapshot(const std::string& name) const;

    // The current snapshot's directory of node, if it exists and holds
    // anything.
    boost::optional<boost::filesystem::path>
    baseline_for(const NodeId& node) const;

    void
    promote(const boost::filesystem::path& snapshot) const;

private:
    DECLARE_LOGGER("SnapshotLayout");

    const boost::filesystem::path root_;
};

}

#endif // !ROUTEBACKUP_SNAPSHOT_LAYOUT_H_

// Local Variables: **
// mode: c++ **
// End: **
