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

#include "FakeTransferTool.h"
#include "../WorkList.h"

#include <signal.h>

#include <memory>
#include <string>
#include <utility>

#include <boost/filesystem/fstream.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/lock_guard.hpp>

namespace routebackuptest
{

namespace fs = boost::filesystem;

using namespace routebackup;

namespace
{

class FakeTransferJob
    : public TransferJob
{
public:
    FakeTransferJob(const TransferRequest& req,
                    const fs::path& source,
                    int fail_status,
                    bool block,
                    std::function<void(const TransferRequest&)> on_finish)
        : req_(req)
        , source_(source)
        , fail_status_(fail_status)
        , block_(block)
        , on_finish_(std::move(on_finish))
        , cancelled_(false)
    {}

    virtual ~FakeTransferJob() = default;

    virtual int
    wait() override final
    {
        if (block_)
        {
            boost::unique_lock<decltype(lock_)> u(lock_);
            cond_.wait(u,
                       [&]
                       {
                           return cancelled_;
                       });
            return 128 + SIGKILL;
        }

        if (fail_status_ != 0)
        {
            diagnostics_ = "rsync: connection unexpectedly closed";
            return fail_status_;
        }

        size_t copied = 0;
        for (const auto& o : WorkListReader::read(req_.file_list))
        {
            const fs::path src(source_ / o.str());
            if (not fs::exists(src))
            {
                continue;
            }

            const fs::path dst(req_.destination / o.str());
            fs::create_directories(dst.parent_path());
            fs::remove(dst);
            fs::copy_file(src,
                          dst);
            ++copied;
        }

        diagnostics_ = std::to_string(copied) + " files transferred";

        if (on_finish_)
        {
            on_finish_(req_);
        }

        return 0;
    }

    virtual std::string
    diagnostics() const override final
    {
        return diagnostics_;
    }

    virtual void
    cancel() override final
    {
        boost::lock_guard<decltype(lock_)> g(lock_);
        cancelled_ = true;
        cond_.notify_all();
    }

private:
    const TransferRequest req_;
    const fs::path source_;
    const int fail_status_;
    const bool block_;
    const std::function<void(const TransferRequest&)> on_finish_;

    boost::mutex lock_;
    boost::condition_variable cond_;
    bool cancelled_;
    std::string diagnostics_;
};

}

FakeTransferTool::FakeTransferTool(const fs::path& source_root)
    : source_root_(source_root)
    , available_(true)
{}

void
FakeTransferTool::check_available()
{
    boost::lock_guard<decltype(lock_)> g(lock_);
    if (not available_)
    {
        throw TransferToolUnavailableException("Fake transfer tool is not available");
    }
}

TransferJobPtr
FakeTransferTool::start(const TransferRequest& req)
{
    std::function<void(const TransferRequest&)> fun;
    TransferJobPtr job;

    {
        boost::lock_guard<decltype(lock_)> g(lock_);

        requests_.push_back(req);

        auto it = failing_.find(req.source_host);
        job = std::make_shared<FakeTransferJob>(req,
                                                node_source(req.source_host),
                                                it == failing_.end() ? 0 : it->second,
                                                blocking_.count(req.source_host) != 0,
                                                on_finish_);
        fun = on_start_;
    }

    LOG_INFO(req.source_host << ": fake transfer to " << req.destination);

    if (fun)
    {
        fun(req);
    }

    return job;
}

fs::path
FakeTransferTool::node_source(const NodeId& node) const
{
    return source_root_ / node.str();
}

void
FakeTransferTool::add_object(const NodeId& node,
                             const std::string& object,
                             const std::string& content)
{
    const fs::path p(node_source(node) / object);
    fs::create_directories(p.parent_path());
    fs::ofstream ofs(p);
    ofs << content;
}

void
FakeTransferTool::set_available(bool available)
{
    boost::lock_guard<decltype(lock_)> g(lock_);
    available_ = available;
}

void
FakeTransferTool::fail_node(const NodeId& node,
                            int exit_status)
{
    boost::lock_guard<decltype(lock_)> g(lock_);
    failing_[node] = exit_status;
}

void
FakeTransferTool::block_node(const NodeId& node)
{
    boost::lock_guard<decltype(lock_)> g(lock_);
    blocking_.insert(node);
}

void
FakeTransferTool::on_start(std::function<void(const TransferRequest&)> fun)
{
    boost::lock_guard<decltype(lock_)> g(lock_);
    on_start_ = std::move(fun);
}

void
FakeTransferTool::on_finish(std::function<void(const TransferRequest&)> fun)
{
    boost::lock_guard<decltype(lock_)> g(lock_);
    on_finish_ = std::move(fun);
}

std::vector<TransferRequest>
FakeTransferTool::requests() const
{
    boost::lock_guard<decltype(lock_)> g(lock_);
    return requests_;
}

boost::optional<TransferRequest>
FakeTransferTool::request_for(const NodeId& node) const
{
    boost::lock_guard<decltype(lock_)> g(lock_);
    for (const auto& r : requests_)
    {
        if (r.source_host == node)
        {
            return r;
        }
    }
    return boost::none;
}

}

// Local Variables: **
// mode: c++ **
// End: **
