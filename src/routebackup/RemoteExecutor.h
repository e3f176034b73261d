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

#ifndef ROUTEBACKUP_REMOTE_EXECUTOR_H_
#define ROUTEBACKUP_REMOTE_EXECUTOR_H_

#include "Types.h"

#include <string>
#include <vector>

#include <rbutils/Exception.h>
#include <rbutils/Logging.h>

namespace routebackup
{

MAKE_EXCEPTION(RemoteExecutorException, rbutils::Exception);

struct RemoteResult
{
    RemoteResult(const std::string& out,
                 int rc)
        : output(out)
        , exit_status(rc)
    {}

    std::string output;
    int exit_status;

    bool
    succeeded() const
    {
        return exit_status == 0;
    }
};

// Runs a shell command on a cluster node and returns its standard output and
// exit status. A failure to even start the transport throws.
class RemoteExecutor
{
public:
    virtual ~RemoteExecutor() = default;

    virtual RemoteResult
    run(const NodeId& host,
        const std::string& command,
        const TransportCompression compression) = 0;
};

class SshRemoteExecutor
    : public RemoteExecutor
{
public:
    SshRemoteExecutor(const std::string& ssh_binary,
                      const std::vector<std::string>& options);

    virtual ~SshRemoteExecutor() = default;

    virtual RemoteResult
    run(const NodeId& host,
        const std::string& command,
        const TransportCompression compression) override final;

    std::vector<std::string>
    make_arguments(const NodeId& host,
                   const std::string& command,
                   const TransportCompression compression) const;

    // The transport as a single command line, for tools that take a remote
    // shell argument (rsync -e).
    std::string
    remote_shell() const;

private:
    DECLARE_LOGGER("SshRemoteExecutor");

    const std::string ssh_binary_;
    const std::vector<std::string> options_;
};

// Single quotes s for a POSIX shell.
std::string
shell_quote(const std::string& s);

}

#endif // !ROUTEBACKUP_REMOTE_EXECUTOR_H_

// Local Variables: **
// mode: c++ **
// End: **
