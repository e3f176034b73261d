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

#include "../TransferTool.h"

#include <rbutils/TestBase.h>

namespace routebackuptest
{

namespace fs = boost::filesystem;

using namespace routebackup;

class TransferToolTest
    : public rbutilstest::TestBase
{
protected:
    TransferRequest
    request() const
    {
        TransferRequest req;
        req.source_host = NodeId("node1");
        req.source_path = "/var/lib/objstore/storage";
        req.destination = "/snapshots/20240101T000000/storage/node1";
        req.file_list = "/tmp/routebackup-abc/worklists/node1.list";
        return req;
    }
};

TEST_F(TransferToolTest, arguments)
{
    const RsyncTransferTool rsync("rsync",
                                  "ssh -o BatchMode=yes",
                                  {});

    const std::vector<std::string> exp{
        "rsync",
        "--archive",
        "--files-from=/tmp/routebackup-abc/worklists/node1.list",
        "--ignore-missing-args",
        "--size-only",
        "--rsh=ssh -o BatchMode=yes",
        "node1:/var/lib/objstore/storage/",
        "/snapshots/20240101T000000/storage/node1/",
    };

    EXPECT_EQ(exp,
              rsync.make_arguments(request()));
}

TEST_F(TransferToolTest, baseline_owner_and_extra_options)
{
    const RsyncTransferTool rsync("/usr/bin/rsync",
                                  "ssh",
                                  { "--timeout=600", "--bwlimit=50M" });

    TransferRequest req(request());
    req.baseline = fs::path("/snapshots/20231231T000000/storage/node1");
    req.remote_owner = std::string("objstore");
    req.source_path = "/var/lib/objstore/storage/";

    const std::vector<std::string> exp{
        "/usr/bin/rsync",
        "--archive",
        "--files-from=/tmp/routebackup-abc/worklists/node1.list",
        "--ignore-missing-args",
        "--size-only",
        "--link-dest=/snapshots/20231231T000000/storage/node1",
        "--rsync-path=sudo -u objstore rsync",
        "--rsh=ssh",
        "--timeout=600",
        "--bwlimit=50M",
        "node1:/var/lib/objstore/storage/",
        "/snapshots/20240101T000000/storage/node1/",
    };

    EXPECT_EQ(exp,
              rsync.make_arguments(req));
}

TEST_F(TransferToolTest, without_size_only_and_ignore_missing)
{
    const RsyncTransferTool rsync("rsync",
                                  "",
                                  {});

    TransferRequest req(request());
    req.size_only = false;
    req.ignore_missing = false;

    const std::vector<std::string> exp{
        "rsync",
        "--archive",
        "--files-from=/tmp/routebackup-abc/worklists/node1.list",
        "node1:/var/lib/objstore/storage/",
        "/snapshots/20240101T000000/storage/node1/",
    };

    EXPECT_EQ(exp,
              rsync.make_arguments(req));
}

TEST_F(TransferToolTest, availability)
{
    RsyncTransferTool missing("/no/such/rsync", "ssh", {});
    EXPECT_THROW(missing.check_available(),
                 TransferToolUnavailableException);

    RsyncTransferTool broken("/bin/false", "ssh", {});
    EXPECT_THROW(broken.check_available(),
                 TransferToolUnavailableException);

    RsyncTransferTool fine("/bin/true", "ssh", {});
    EXPECT_NO_THROW(fine.check_available());
}

// /bin/sh does not understand rsync's options; what matters is that the
// job reports the failure
TEST_F(TransferToolTest, failing_job)
{
    RsyncTransferTool rsync("/bin/sh", "", {});

    TransferJobPtr job(rsync.start(request()));
    ASSERT_TRUE(job != nullptr);

    EXPECT_NE(0, job->wait());
}

}

// Local Variables: **
// mode: c++ **
// End: **
