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

#include <sstream>

#include <rbutils/System.h>

namespace routebackup
{

std::string
shell_quote(const std::string& s)
{
    if (not s.empty() and
        s.find_first_not_of("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_-+=.,:/@%") ==
        std::string::npos)
    {
        return s;
    }

    std::string res("'");
    for (const char c : s)
    {
        if (c == '\'')
        {
            res += "'\\''";
        }
        else
        {
            res += c;
        }
    }
    res += "'";
    return res;
}

SshRemoteExecutor::SshRemoteExecutor(const std::string& ssh_binary,
                                     const std::vector<std::string>& options)
    : ssh_binary_(ssh_binary)
    , options_(options)
{
    if (ssh_binary_.empty())
    {
        throw RemoteExecutorException("No ssh binary configured");
    }
}

std::vector<std::string>
SshRemoteExecutor::make_arguments(const NodeId& host,
                                  const std::string& command,
                                  const TransportCompression compression) const
{
    std::vector<std::string> args;
    args.reserve(options_.size() + 5);

    args.push_back(ssh_binary_);
    args.insert(args.end(),
                options_.begin(),
                options_.end());

    if (T(compression))
    {
        args.push_back("-C");
    }

    args.push_back("--");
    args.push_back(host.str());
    args.push_back(command);

    return args;
}

std::string
SshRemoteExecutor::remote_shell() const
{
    std::stringstream ss;
    ss << shell_quote(ssh_binary_);
    for (const auto& o : options_)
    {
        ss << " " << shell_quote(o);
    }
    return ss.str();
}

RemoteResult
SshRemoteExecutor::run(const NodeId& host,
                       const std::string& command,
                       const TransportCompression compression)
{
    LOG_INFO(host << ": running '" << command << "'");

    const auto res(rbutils::System::exec(make_arguments(host,
                                                        command,
                                                        compression)));
    if (res.second != 0)
    {
        LOG_WARN(host << ": '" << command << "' exited with status " << res.second);
    }

    return RemoteResult(res.first,
                        res.second);
}

}

// Local Variables: **
// mode: c++ **
// End: **
