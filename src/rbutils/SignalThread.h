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

#ifndef RBUTILS_SIGNAL_THREAD_H_
#define RBUTILS_SIGNAL_THREAD_H_

#include "Exception.h"
#include "Logging.h"

#include <functional>
#include <initializer_list>

#include <signal.h>

#include <boost/asio/io_service.hpp>
#include <boost/thread.hpp>

namespace rbutils
{

class SignalSet
{
public:
    MAKE_EXCEPTION(Exception,
                   ::rbutils::Exception);

    explicit SignalSet(const std::initializer_list<int>& sigs);

    ~SignalSet() = default;

    SignalSet(const SignalSet&) = default;

    SignalSet&
    operator=(const SignalSet&) = default;

    void
    insert(int sig);

    void
    erase(int sig);

    bool
    contains(int sig) const;

    const sigset_t&
    sigset() const
    {
        return sigset_;
    }

private:
    DECLARE_LOGGER("SignalSet");

    sigset_t sigset_;
};

// Blocks the given signals in the calling thread for its lifetime; threads
// and child processes started meanwhile inherit the mask.
class SignalBlocker
{
public:
    MAKE_EXCEPTION(Exception,
                   ::rbutils::Exception);

    explicit SignalBlocker(const SignalSet& set);

    ~SignalBlocker();

    SignalBlocker(const SignalBlocker&) = delete;

    SignalBlocker&
    operator=(const SignalBlocker&) = delete;

private:
    DECLARE_LOGGER("SignalBlocker");

    sigset_t stored_;
};

// Receives the signals of sigset synchronously on a dedicated thread (via
// signalfd) and invokes handler there. Construct it before any other thread
// so that the signals stay blocked everywhere else.
class SignalThread
{
public:
    MAKE_EXCEPTION(Exception,
                   ::rbutils::Exception);

    using Handler = std::function<void(int signal)>;

    SignalThread(const SignalSet& sigset,
                 Handler handler);

    ~SignalThread();

    SignalThread(const SignalThread&) = delete;

    SignalThread&
    operator=(const SignalThread&) = delete;

private:
    DECLARE_LOGGER("SignalThread");

    SignalBlocker blocker_;
    Handler handler_;
    boost::asio::io_service io_service_;
    boost::thread thread_;

    void
    run_(const SignalSet& sigset);
};

}

#endif // !RBUTILS_SIGNAL_THREAD_H_

// Local Variables: **
// mode: c++ **
// End: **
