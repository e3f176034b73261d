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

#include "Assert.h"
#include "Catchers.h"
#include "SignalThread.h"

#include <string.h>
#include <unistd.h>

#include <sys/signalfd.h>

#include <boost/asio/posix/stream_descriptor.hpp>

namespace rbutils
{

namespace ba = boost::asio;
namespace bs = boost::system;

SignalSet::SignalSet(const std::initializer_list<int>& sigs)
{
    int ret = sigemptyset(&sigset_);
    if (ret < 0)
    {
        LOG_ERROR("Failed to create empty sigset: " << strerror(errno));
        throw Exception("Failed to create empty sigset");
    }

    for (const auto& sig : sigs)
    {
        insert(sig);
    }
}

void
SignalSet::insert(int sig)
{
    int ret = sigaddset(&sigset_,
                        sig);
    if (ret < 0)
    {
        LOG_ERROR("Failed to add signal " << sig << " to sigset: " << strerror(errno));
        throw Exception("Failed to add signal to sigset");
    }
}

void
SignalSet::erase(int sig)
{
    int ret = sigdelset(&sigset_,
                        sig);
    if (ret < 0)
    {
        LOG_ERROR("Failed to remove signal " << sig << " from sigset: " << strerror(errno));
        throw Exception("Failed to remove signal from sigset");
    }
}

bool
SignalSet::contains(int sig) const
{
    int ret = sigismember(&sigset_,
                          sig);
    if (ret < 0)
    {
        LOG_ERROR("Failed to check signal " << sig << " in sigset: " << strerror(errno));
        throw Exception("Failed to check sigset membership");
    }
    return ret == 1;
}

SignalBlocker::SignalBlocker(const SignalSet& set)
{
    int ret = pthread_sigmask(SIG_BLOCK,
                              &set.sigset(),
                              &stored_);
    if (ret)
    {
        LOG_ERROR("Failed to block signals: " << strerror(ret));
        throw Exception("Failed to modify sigmask");
    }
}

SignalBlocker::~SignalBlocker()
{
    int ret = pthread_sigmask(SIG_SETMASK,
                              &stored_,
                              nullptr);
    if (ret)
    {
        LOG_ERROR("Failed to restore sigmask: " << strerror(ret));
    }
}

SignalThread::SignalThread(const SignalSet& sigset,
                           Handler handler)
    : blocker_(sigset)
    , handler_(std::move(handler))
{
    thread_ = boost::thread([this, sigset]
                            {
                                try
                                {
                                    run_(sigset);
                                }
                                CATCH_STD_LOG_IGNORE("signal thread caught exception");
                            });
}

SignalThread::~SignalThread()
{
    io_service_.stop();

    try
    {
        thread_.join();
    }
    CATCH_STD_LOG_IGNORE("failed to join signal thread");
}

void
SignalThread::run_(const SignalSet& sigset)
{
    const int sigfd = signalfd(-1,
                               &sigset.sigset(),
                               SFD_NONBLOCK);
    if (sigfd < 0)
    {
        LOG_ERROR("Failed to create signalfd: " << strerror(errno));
        throw Exception("Failed to create signalfd");
    }

    // the stream_descriptor below takes ownership of sigfd
    ba::posix::stream_descriptor sigdesc(io_service_,
                                         sigfd);

    std::function<void()> g;

    auto f([&](const bs::error_code& ec,
               std::size_t bytes)
           {
               VERIFY(bytes == 0);

               if (ec)
               {
                   if (ec != ba::error::operation_aborted)
                   {
                       LOG_ERROR("error in signal handler: " << ec.message());
                   }
                   return;
               }

               signalfd_siginfo si;
               const ssize_t ret = ::read(sigfd,
                                          &si,
                                          sizeof(si));
               if (ret < 0)
               {
                   const int err = errno;
                   if (err != EAGAIN)
                   {
                       LOG_ERROR("failed to read siginfo from signalfd: " <<
                                 strerror(err) << " (" << err << ")");
                   }
               }
               else if (ret != sizeof(si))
               {
                   LOG_ERROR("read less (" << ret << ") than expected (" <<
                             sizeof(si) << ") from signalfd");
               }
               else
               {
                   LOG_INFO("caught signal " << si.ssi_signo);
                   handler_(si.ssi_signo);
               }

               g();
           });

    g = [&]()
        {
            sigdesc.async_read_some(ba::null_buffers(),
                                    f);
        };

    g();

    bs::error_code ec;
    io_service_.run(ec);

    if (ec)
    {
        LOG_ERROR("error running I/O service of signal thread: " <<
                  ec.message());
    }

    LOG_INFO("exiting signal handler thread");
}

}

// Local Variables: **
// mode: c++ **
// End: **
