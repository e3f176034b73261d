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

#ifndef ROUTEBACKUP_BACKUP_H_
#define ROUTEBACKUP_BACKUP_H_

#include "BackupConfig.h"
#include "ClusterTopology.h"
#include "CompletenessVerifier.h"
#include "MaintenanceLock.h"
#include "RemoteExecutor.h"
#include "SnapshotLayout.h"
#include "TransferDispatcher.h"
#include "TransferTool.h"
#include "Types.h"

#include <atomic>
#include <iostream>

#include <boost/filesystem.hpp>
#include <boost/optional.hpp>

#include <rbutils/Exception.h>
#include <rbutils/Logging.h>

namespace routebackup
{

MAKE_EXCEPTION(BackupException, rbutils::Exception);
MAKE_EXCEPTION(BackupInterruptedException, BackupException);

enum class BackupStatus
{
    // includes "nothing to back up" and verification warnings
    Success,
    // nothing or not everything was attempted
    Aborted,
    // at least one node transfer failed; the partial snapshot is kept
    PartialFailure,
};

std::ostream&
operator<<(std::ostream& os,
           const BackupStatus s);

// Process exit status for s: 0, 1 and 2 respectively.
int
exit_status(const BackupStatus s);

struct BackupSummary
{
    size_t routes = 0;
    NodeIds locked_nodes;
    boost::optional<boost::filesystem::path> snapshot;
    DispatchResult dispatch;
    boost::optional<VerificationReport> verification;
    boost::optional<boost::filesystem::path> verification_report;
    // nodes on which maintenance could not be resumed
    NodeIds maintenance_failures;
    bool promoted = false;
};

// One backup run: suspend maintenance, fetch and partition the routes,
// transfer the objects of all nodes concurrently into a new snapshot, resume
// maintenance, verify the snapshot and make it the current one.
class Backup
{
public:
    Backup(const BackupConfig& config,
           RemoteExecutor& executor,
           ClusterTopology& topology,
           TransferTool& tool,
           std::ostream& diagnostics = std::cerr);

    ~Backup() = default;

    Backup(const Backup&) = delete;

    Backup&
    operator=(const Backup&) = delete;

    // Does not throw; errors are logged, reported on diagnostics and
    // mapped to the returned status.
    BackupStatus
    operator()();

    // Safe to call from another thread (the signal handler): running
    // transfers are killed and the run is aborted at the next phase
    // boundary, resuming maintenance on the way out.
    void
    interrupt();

    bool
    interrupted() const
    {
        return interrupted_;
    }

    const BackupSummary&
    summary() const
    {
        return summary_;
    }

private:
    DECLARE_LOGGER("Backup");

    const BackupConfig config_;
    RemoteExecutor& executor_;
    ClusterTopology& topology_;
    TransferTool& tool_;
    std::ostream& diagnostics_;

    SnapshotLayout layout_;
    LockCoordinator coordinator_;
    TransferDispatcher dispatcher_;
    std::atomic<bool> interrupted_;
    BackupSummary summary_;

    BackupStatus
    run_();

    BackupStatus
    transfer_phase_(const WorkListFiles& lists);

    // Advisory: failures end up in the diagnostics, never in the status.
    void
    verify_phase_(const WorkListFiles& lists);

    NodeIds
    maintenance_nodes_();

    void
    check_interrupted_(const char* phase) const;

    void
    report_maintenance_();
};

}

#endif // !ROUTEBACKUP_BACKUP_H_

// Local Variables: **
// mode: c++ **
// End: **
