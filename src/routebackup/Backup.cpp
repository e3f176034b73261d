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

#include "Backup.h"
#include "RouteResolver.h"
#include "WorkDirectory.h"
#include "WorkList.h"

#include <set>

#include <rbutils/Assert.h>
#include <rbutils/Catchers.h>

namespace routebackup
{

namespace fs = boost::filesystem;

std::ostream&
operator<<(std::ostream& os,
           const BackupStatus s)
{
    switch (s)
    {
    case BackupStatus::Success:
        return os << "Success";
    case BackupStatus::Aborted:
        return os << "Aborted";
    case BackupStatus::PartialFailure:
        return os << "PartialFailure";
    }
    UNREACHABLE;
}

int
exit_status(const BackupStatus s)
{
    switch (s)
    {
    case BackupStatus::Success:
        return 0;
    case BackupStatus::Aborted:
        return 1;
    case BackupStatus::PartialFailure:
        return 2;
    }
    UNREACHABLE;
}

Backup::Backup(const BackupConfig& config,
               RemoteExecutor& executor,
               ClusterTopology& topology,
               TransferTool& tool,
               std::ostream& diagnostics)
    : config_(config)
    , executor_(executor)
    , topology_(topology)
    , tool_(tool)
    , diagnostics_(diagnostics)
    , layout_(config_.snapshot_root)
    , coordinator_(executor_,
                   config_.maintenance_disable_command,
                   config_.maintenance_enable_command)
    , dispatcher_(executor_,
                  tool_,
                  layout_,
                  config_.storage_root,
                  config_.default_owner)
    , interrupted_(false)
{
    config_.validate();
}

void
Backup::interrupt()
{
    LOG_WARN("Interrupting backup");
    interrupted_ = true;
    dispatcher_.cancel();
}

void
Backup::check_interrupted_(const char* phase) const
{
    if (interrupted_)
    {
        LOG_ERROR("Interrupted " << phase);
        throw BackupInterruptedException("Backup interrupted",
                                         phase);
    }
}

NodeIds
Backup::maintenance_nodes_()
{
    if (F(config_.clustered))
    {
        return NodeIds{ config_.host };
    }

    const NodeIds nodes(topology_.list_nodes(config_.node_role));
    if (nodes.empty())
    {
        LOG_FATAL("No " << config_.node_role << " nodes in the cluster");
        throw BackupException("Cluster has no nodes to back up",
                              config_.node_role.c_str());
    }

    return nodes;
}

BackupStatus
Backup::operator()()
{
    BackupStatus status = BackupStatus::Aborted;

    try
    {
        status = run_();
    }
    catch (BackupInterruptedException& e)
    {
        LOG_ERROR("Backup was interrupted: " << e.what());
        diagnostics_ << "Backup interrupted" << std::endl;
    }
    catch (std::exception& e)
    {
        LOG_FATAL("Backup failed: " << e.what());
        diagnostics_ << "Backup failed: " << e.what() << std::endl;
    }

    report_maintenance_();

    LOG_INFO("Backup finished with status " << status);
    return status;
}

void
Backup::report_maintenance_()
{
    summary_.maintenance_failures = coordinator_.locked_nodes();

    for (const auto& n : summary_.maintenance_failures)
    {
        diagnostics_ << "WARNING: background maintenance could not be resumed on " <<
            n << ". " << coordinator_.remediation(n) << std::endl;
    }
}

BackupStatus
Backup::run_()
{
    tool_.check_available();

    WorkDirectory work(config_.scratch_dir);

    summary_.locked_nodes = maintenance_nodes_();
    check_interrupted_("before suspending maintenance");

    std::vector<Route> routes;
    WorkListFiles lists;
    BackupStatus status = BackupStatus::Success;

    {
        ScopedMaintenanceSuspension suspension(coordinator_,
                                               summary_.locked_nodes);

        check_interrupted_("before querying the routes");

        RouteResolver resolver(executor_,
                               config_.host,
                               config_.route_query_command,
                               config_.object_path_depth,
                               config_.compress);

        routes = resolver.resolve(work.newFile("routes.dump"));
        summary_.routes = routes.size();

        if (routes.empty())
        {
            LOG_WARN("No routes found, skipping");
            diagnostics_ << "WARNING: no routes found, skipping" << std::endl;
            return BackupStatus::Success;
        }

        const RoutePartitioner partitioner(config_.clustered,
                                           config_.host);
        const WorkListWriter writer(work.path() / "worklists");
        lists = writer.write(partitioner.partition(routes));

        const std::set<NodeId> locked(summary_.locked_nodes.begin(),
                                      summary_.locked_nodes.end());
        for (const auto& p : lists)
        {
            if (locked.find(p.first) == locked.end())
            {
                LOG_WARN(p.first << " holds objects but is not a " << config_.node_role <<
                         " node, maintenance was not suspended there");
            }
        }

        check_interrupted_("before transferring");

        status = transfer_phase_(lists);

        check_interrupted_("while transferring");

        const NodeIds failed(suspension.release());
        if (not failed.empty())
        {
            LOG_ERROR(failed.size() << " nodes still have maintenance suspended");
        }
    }

    VERIFY(summary_.snapshot);

    if (T(config_.skip_verification))
    {
        LOG_INFO("Skipping verification");
    }
    else
    {
        verify_phase_(lists);
    }

    if (status == BackupStatus::Success)
    {
        layout_.promote(*summary_.snapshot);
        summary_.promoted = true;
        LOG_INFO("Backup of " << summary_.routes << " routes to " <<
                 *summary_.snapshot << " completed");
    }
    else
    {
        diagnostics_ << "ERROR: transfers failed for";
        for (const auto& n : summary_.dispatch.failed_nodes())
        {
            diagnostics_ << " " << n;
        }
        diagnostics_ << ". The partial snapshot " << *summary_.snapshot <<
            " is kept but not made current." << std::endl;
    }

    return status;
}

void
Backup::verify_phase_(const WorkListFiles& lists)
{
    try
    {
        const CompletenessVerifier verifier(config_.object_path_depth);
        summary_.verification =
            verifier.verify(lists,
                            SnapshotLayout::storage_directory(*summary_.snapshot));
    }
    CATCH_STD_EWHAT({
            LOG_ERROR("Verification of " << *summary_.snapshot << " failed: " << EWHAT);
            diagnostics_ << "WARNING: verification of " << *summary_.snapshot <<
                " could not be completed (" << EWHAT <<
                "). Please contact support." << std::endl;
            return;
        });

    if (summary_.verification->empty())
    {
        return;
    }

    diagnostics_ << "WARNING: " << summary_.verification->missing.size() <<
        " of " << summary_.verification->expected <<
        " objects are missing from " << *summary_.snapshot;

    try
    {
        summary_.verification_report =
            CompletenessVerifier::write_report(*summary_.verification,
                                               *summary_.snapshot);
        diagnostics_ << ", they are listed in " << *summary_.verification_report;
    }
    CATCH_STD_EWHAT({
            LOG_ERROR("Failed to write the list of missing objects: " << EWHAT);
            diagnostics_ << ", the list of them could not be written (" << EWHAT << ")";
        });

    diagnostics_ << ". Please contact support." << std::endl;
}

BackupStatus
Backup::transfer_phase_(const WorkListFiles& lists)
{
    summary_.snapshot = layout_.create_snapshot(SnapshotLayout::timestamp_name());

    summary_.dispatch = dispatcher_.dispatch(lists,
                                             *summary_.snapshot);

    if (summary_.dispatch.all_succeeded())
    {
        return BackupStatus::Success;
    }
    else
    {
        for (const auto& j : summary_.dispatch.jobs)
        {
            if (not j.succeeded())
            {
                LOG_ERROR(j);
            }
        }
        return BackupStatus::PartialFailure;
    }
}

}

// Local Variables: **
// mode: c++ **
// End: **
