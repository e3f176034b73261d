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

#include "TransferDispatcher.h"

#include <future>
#include <iostream>

#include <boost/algorithm/string/trim.hpp>
#include <boost/thread/lock_guard.hpp>

#include <rbutils/Catchers.h>

namespace routebackup
{

namespace fs = boost::filesystem;

std::ostream&
operator<<(std::ostream& os,
           const TransferJobResult& res)
{
    os << res.node << ": ";
    if (res.cancelled)
    {
        os << "cancelled";
    }
    else if (res.succeeded())
    {
        os << "ok";
    }
    else
    {
        os << "failed, exit status " << res.exit_status;
    }

    return os << ", " << res.objects << " objects, owner " << res.owner <<
        (res.baseline ? ", baseline " + res.baseline->string() : std::string(", no baseline"));
}

bool
DispatchResult::all_succeeded() const
{
    for (const auto& j : jobs)
    {
        if (not j.succeeded())
        {
            return false;
        }
    }
    return true;
}

NodeIds
DispatchResult::failed_nodes() const
{
    NodeIds nodes;
    for (const auto& j : jobs)
    {
        if (not j.succeeded())
        {
            nodes.push_back(j.node);
        }
    }
    return nodes;
}

TransferDispatcher::TransferDispatcher(RemoteExecutor& executor,
                                       TransferTool& tool,
                                       const SnapshotLayout& layout,
                                       const fs::path& storage_root,
                                       const std::string& default_owner)
    : executor_(executor)
    , tool_(tool)
    , layout_(layout)
    , storage_root_(storage_root)
    , default_owner_(default_owner)
    , cancelled_(false)
{}

std::string
TransferDispatcher::probe_owner(const NodeId& node)
{
    try
    {
        const RemoteResult res(executor_.run(node,
                                             "stat -c %U " + shell_quote(storage_root_.string()),
                                             TransportCompression::F));
        std::string owner(res.output);
        boost::algorithm::trim(owner);

        if (res.succeeded() and not owner.empty())
        {
            LOG_INFO(node << ": " << storage_root_ << " is owned by " << owner);
            return owner;
        }

        LOG_WARN(node << ": failed to determine the owner of " << storage_root_ <<
                 " (exit status " << res.exit_status << "), using " << default_owner_);
    }
    CATCH_STD_EWHAT(LOG_WARN(node << ": failed to determine the owner of " <<
                             storage_root_ << ": " << EWHAT << ", using " <<
                             default_owner_););

    return default_owner_;
}

TransferJobResult
TransferDispatcher::run_job_(const NodeId& node,
                             const WorkListFile& list,
                             const fs::path& snapshot)
{
    TransferJobResult res(node);
    res.objects = list.entries;

    try
    {
        TransferRequest req;
        req.source_host = node;
        req.source_path = storage_root_;
        req.destination = SnapshotLayout::node_directory(snapshot,
                                                         node);
        req.file_list = list.path;
        req.baseline = layout_.baseline_for(node);

        res.owner = probe_owner(node);
        req.remote_owner = res.owner;
        res.baseline = req.baseline;

        fs::create_directories(req.destination);

        TransferJobPtr job;

        {
            boost::lock_guard<decltype(lock_)> g(lock_);
            if (cancelled_)
            {
                LOG_WARN(node << ": not starting transfer, dispatch was cancelled");
                res.cancelled = true;
                return res;
            }

            job = tool_.start(req);
            running_.emplace(node,
                             job);
        }

        res.exit_status = job->wait();
        res.diagnostics = job->diagnostics();

        {
            boost::lock_guard<decltype(lock_)> g(lock_);
            running_.erase(node);
            res.cancelled = cancelled_ and res.exit_status != 0;
        }
    }
    CATCH_STD_EWHAT({
            LOG_ERROR(node << ": transfer failed: " << EWHAT);
            boost::lock_guard<decltype(lock_)> g(lock_);
            running_.erase(node);
            res.exit_status = -1;
            res.diagnostics = EWHAT;
        });

    if (res.succeeded())
    {
        LOG_INFO(res);
    }
    else
    {
        LOG_ERROR(res);
        if (not res.diagnostics.empty())
        {
            LOG_ERROR(node << ": transfer output: " << res.diagnostics);
        }
    }

    return res;
}

DispatchResult
TransferDispatcher::dispatch(const WorkListFiles& lists,
                             const fs::path& snapshot)
{
    DispatchResult result;

    std::vector<std::future<TransferJobResult>> futures;
    futures.reserve(lists.size());

    for (const auto& p : lists)
    {
        if (p.second.entries == 0)
        {
            LOG_INFO(p.first << ": empty work list, nothing to transfer");
            continue;
        }

        const NodeId node(p.first);
        const WorkListFile list(p.second);

        futures.emplace_back(std::async(std::launch::async,
                                        [this, node, list, snapshot]() -> TransferJobResult
                                        {
                                            return run_job_(node,
                                                            list,
                                                            snapshot);
                                        }));
    }

    if (futures.empty())
    {
        LOG_WARN("No routes found, skipping");
        result.skipped = true;
        return result;
    }

    LOG_INFO("Started " << futures.size() << " transfers, waiting for them");

    for (auto& f : futures)
    {
        result.jobs.emplace_back(f.get());
    }

    LOG_INFO(result.jobs.size() << " transfers done, " <<
             result.failed_nodes().size() << " failed");

    return result;
}

void
TransferDispatcher::cancel()
{
    boost::lock_guard<decltype(lock_)> g(lock_);

    cancelled_ = true;

    for (auto& p : running_)
    {
        LOG_WARN(p.first << ": cancelling transfer");
        try
        {
            p.second->cancel();
        }
        CATCH_STD_LOG_IGNORE(p.first << ": failed to cancel transfer");
    }
}

}

// Local Variables: **
// mode: c++ **
// End: **
