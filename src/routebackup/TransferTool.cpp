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

#include "RemoteExecutor.h"
#include "TransferTool.h"

#include <signal.h>

#include <boost/algorithm/string/predicate.hpp>

#include <rbutils/System.h>

namespace routebackup
{

namespace fs = boost::filesystem;

namespace
{

// The last lines of output are what matters when rsync fails.
std::string
tail(const std::string& str,
     size_t max_size = 4096)
{
    if (str.size() <= max_size)
    {
        return str;
    }
    else
    {
        return "..." + str.substr(str.size() - max_size);
    }
}

class RsyncJob
    : public TransferJob
{
public:
    explicit RsyncJob(const std::vector<std::string>& args)
        : proc_(args)
    {}

    virtual ~RsyncJob() = default;

    virtual int
    wait() override final
    {
        return proc_.wait();
    }

    virtual std::string
    diagnostics() const override final
    {
        // rsync reports its errors on stderr
        return tail(proc_.output() + proc_.errors());
    }

    // Children inherit the blocked signal mask of the signal handling
    // thread, hence SIGKILL.
    virtual void
    cancel() override final
    {
        proc_.kill(SIGKILL);
    }

private:
    rbutils::ChildProcess proc_;
};

// rsync treats a trailing slash on the source as "the contents of"
std::string
with_trailing_slash(const fs::path& p)
{
    std::string s(p.string());
    if (not boost::algorithm::ends_with(s, "/"))
    {
        s += "/";
    }
    return s;
}

}

RsyncTransferTool::RsyncTransferTool(const std::string& rsync_binary,
                                     const std::string& remote_shell,
                                     const std::vector<std::string>& extra_options)
    : rsync_binary_(rsync_binary)
    , remote_shell_(remote_shell)
    , extra_options_(extra_options)
{}

void
RsyncTransferTool::check_available()
{
    std::pair<std::string, int> res;

    try
    {
        res = rbutils::System::exec({ rsync_binary_, "--version" });
    }
    catch (rbutils::ProcessException& e)
    {
        LOG_FATAL("Could not run " << rsync_binary_ << ": " << e.what());
        throw TransferToolUnavailableException("Transfer tool cannot be started",
                                               rsync_binary_.c_str());
    }

    if (res.second != 0)
    {
        LOG_FATAL(rsync_binary_ << " --version exited with status " << res.second);
        throw TransferToolUnavailableException("Transfer tool is not usable",
                                               rsync_binary_.c_str());
    }

    const std::string first_line(res.first.substr(0, res.first.find('\n')));
    LOG_INFO("Using " << first_line);
}

std::vector<std::string>
RsyncTransferTool::make_arguments(const TransferRequest& req) const
{
    std::vector<std::string> args;

    args.push_back(rsync_binary_);
    args.push_back("--archive");
    args.push_back("--files-from=" + req.file_list.string());

    if (req.ignore_missing)
    {
        args.push_back("--ignore-missing-args");
    }

    if (req.size_only)
    {
        args.push_back("--size-only");
    }

    if (req.baseline)
    {
        args.push_back("--link-dest=" + req.baseline->string());
    }

    if (req.remote_owner)
    {
        args.push_back("--rsync-path=sudo -u " + shell_quote(*req.remote_owner) + " rsync");
    }

    if (not remote_shell_.empty())
    {
        args.push_back("--rsh=" + remote_shell_);
    }

    args.insert(args.end(),
                extra_options_.begin(),
                extra_options_.end());

    args.push_back(req.source_host.str() + ":" + with_trailing_slash(req.source_path));
    args.push_back(with_trailing_slash(req.destination));

    return args;
}

TransferJobPtr
RsyncTransferTool::start(const TransferRequest& req)
{
    LOG_INFO(req.source_host << ": transferring objects listed in " << req.file_list <<
             " to " << req.destination <<
             (req.baseline ? ", baseline " + req.baseline->string() : std::string(", no baseline")));

    return std::make_shared<RsyncJob>(make_arguments(req));
}

}

// Local Variables: **
// mode: c++ **
// End: **
