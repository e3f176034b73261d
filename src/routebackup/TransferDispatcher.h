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

#ifndef ROUTEBACKUP_TRANSFER_DISPATCHER_H_
#define ROUTEBACKUP_TRANSFER_DISPATCHER_H_

#include "RemoteExecutor.h"
#include "SnapshotLayout.h"
#include "TransferTool.h"
#include "Types.h"
#include "WorkList.h"

#include <iosfwd>
#include <map>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>
#include <boost/optional.hpp>
#include <boost/thread/mutex.hpp>

#include <rbutils/Logging.h>

namespace routebackup
{

struct TransferJobResult
{
    explicit TransferJobResult(const NodeId& n)
        : node(n)
    {}

    NodeId node;
    int exit_status = -1;
    bool cancelled = false;
    boost::optional<boost::filesystem::path> baseline;
    std::string owner;
    std::string diagnostics;
    size_t objects = 0;

    bool
    succeeded() const
    {
        return not cancelled and exit_status == 0;
    }
};

std::ostream&
operator<<(std::ostream& os,
           const TransferJobResult& res);

using TransferJobResults = std::vector<TransferJobResult>;

struct DispatchResult
{
    // No work lists with any entries: nothing was started.
    bool skipped = false;
    TransferJobResults jobs;

    bool
    all_succeeded() const;

    NodeIds
    failed_nodes() const;
};

// Runs one transfer per node work list, all of them concurrently, and waits
// for all of them. A failing transfer does not affect the others.
class TransferDispatcher
{
public:
    TransferDispatcher(RemoteExecutor& executor,
                       TransferTool& tool,
                       const SnapshotLayout& layout,
                       const boost::filesystem::path& storage_root,
                       const std::string& default_owner);

    ~TransferDispatcher() = default;

    TransferDispatcher(const TransferDispatcher&) = delete;

    TransferDispatcher&
    operator=(const TransferDispatcher&) = delete;

    // Node data ends up in <snapshot>/storage/<node>.
    DispatchResult
    dispatch(const WorkListFiles& lists,
             const boost::filesystem::path& snapshot);

    // Kills all running transfers; transfers not yet started are not
    // started anymore. Can be called from any thread.
    void
    cancel();

    // Owner of the storage root on node, default_owner if that can't be
    // determined.
    std::string
    probe_owner(const NodeId& node);

private:
    DECLARE_LOGGER("TransferDispatcher");

    RemoteExecutor& executor_;
    TransferTool& tool_;
    const SnapshotLayout& layout_;
    const boost::filesystem::path storage_root_;
    const std::string default_owner_;

    boost::mutex lock_;
    std::map<NodeId, TransferJobPtr> running_;
    bool cancelled_;

    TransferJobResult
    run_job_(const NodeId& node,
             const WorkListFile& list,
             const boost::filesystem::path& snapshot);
};

}

#endif // !ROUTEBACKUP_TRANSFER_DISPATCHER_H_

// Local Variables: **
// mode: c++ **
// End: **
