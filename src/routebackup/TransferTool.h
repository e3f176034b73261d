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

#ifndef ROUTEBACKUP_TRANSFER_TOOL_H_
#define ROUTEBACKUP_TRANSFER_TOOL_H_

#include "Types.h"

#include <memory>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>
#include <boost/optional.hpp>

#include <rbutils/ChildProcess.h>
#include <rbutils/Exception.h>
#include <rbutils/Logging.h>

namespace routebackup
{

MAKE_EXCEPTION(TransferToolUnavailableException, rbutils::Exception);

// Copy the objects listed in file_list from source_host:source_path to
// destination. Objects that vanished in the meantime are skipped, unchanged
// objects (by size) are not transferred, and files identical to the ones in
// baseline are taken from there.
struct TransferRequest
{
    NodeId source_host;
    boost::filesystem::path source_path;
    boost::filesystem::path destination;
    boost::filesystem::path file_list;
    boost::optional<boost::filesystem::path> baseline;
    boost::optional<std::string> remote_owner;
    bool size_only = true;
    bool ignore_missing = true;
};

// A running transfer.
class TransferJob
{
public:
    virtual ~TransferJob() = default;

    // Blocks until the transfer is done; returns its exit status.
    virtual int
    wait() = 0;

    // Diagnostic output of the finished transfer.
    virtual std::string
    diagnostics() const = 0;

    // Aborts the transfer; wait() returns a non-zero status afterwards.
    virtual void
    cancel() = 0;
};

using TransferJobPtr = std::shared_ptr<TransferJob>;

class TransferTool
{
public:
    virtual ~TransferTool() = default;

    // Throws TransferToolUnavailableException if transfers can't be run.
    virtual void
    check_available() = 0;

    // Starts the transfer without waiting for it.
    virtual TransferJobPtr
    start(const TransferRequest& req) = 0;
};

class RsyncTransferTool
    : public TransferTool
{
public:
    RsyncTransferTool(const std::string& rsync_binary,
                      const std::string& remote_shell,
                      const std::vector<std::string>& extra_options);

    virtual ~RsyncTransferTool() = default;

    virtual void
    check_available() override final;

    virtual TransferJobPtr
    start(const TransferRequest& req) override final;

    std::vector<std::string>
    make_arguments(const TransferRequest& req) const;

private:
    DECLARE_LOGGER("RsyncTransferTool");

    const std::string rsync_binary_;
    const std::string remote_shell_;
    const std::vector<std::string> extra_options_;
};

}

#endif // !ROUTEBACKUP_TRANSFER_TOOL_H_

// Local Variables: **
// mode: c++ **
// End: **
