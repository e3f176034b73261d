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

#ifndef ROUTEBACKUP_COMPLETENESS_VERIFIER_H_
#define ROUTEBACKUP_COMPLETENESS_VERIFIER_H_

#include "Route.h"
#include "Types.h"
#include "WorkList.h"

#include <boost/filesystem.hpp>
#include <boost/optional.hpp>

#include <rbutils/Logging.h>

namespace routebackup
{

struct VerificationReport
{
    // requested but not found in the snapshot
    ObjectPaths missing;
    size_t expected = 0;
    size_t found = 0;
    // found but not requested; informational only
    size_t unexpected = 0;

    bool
    empty() const
    {
        return missing.empty();
    }
};

// Compares the objects that were requested from the nodes with the objects
// that made it into the snapshot.
class CompletenessVerifier
{
public:
    explicit CompletenessVerifier(unsigned object_path_depth = default_object_path_depth);

    ~CompletenessVerifier() = default;

    CompletenessVerifier(const CompletenessVerifier&) = delete;

    CompletenessVerifier&
    operator=(const CompletenessVerifier&) = delete;

    // Expected: the union of all work lists. Found: the regular files at
    // exactly object depth below each node directory of storage_dir.
    VerificationReport
    verify(const WorkListFiles& lists,
           const boost::filesystem::path& storage_dir) const;

    // Sorted and unique.
    ObjectPaths
    collect_objects(const boost::filesystem::path& storage_dir) const;

    // Writes the missing objects to <snapshot>/verification-missing.txt and
    // returns its path; nothing is written for an empty report.
    static boost::optional<boost::filesystem::path>
    write_report(const VerificationReport& report,
                 const boost::filesystem::path& snapshot);

private:
    DECLARE_LOGGER("CompletenessVerifier");

    const unsigned depth_;
};

}

#endif // !ROUTEBACKUP_COMPLETENESS_VERIFIER_H_

// Local Variables: **
// mode: c++ **
// End: **
