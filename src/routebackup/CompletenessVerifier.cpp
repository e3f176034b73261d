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

#include "CompletenessVerifier.h"

#include <algorithm>
#include <iterator>
#include <set>

#include <boost/filesystem/fstream.hpp>

namespace routebackup
{

namespace fs = boost::filesystem;

CompletenessVerifier::CompletenessVerifier(unsigned object_path_depth)
    : depth_(object_path_depth)
{
    if (depth_ == 0)
    {
        throw RouteFormatException("Object path depth must not be 0");
    }
}

ObjectPaths
CompletenessVerifier::collect_objects(const fs::path& storage_dir) const
{
    std::set<ObjectPath> objects;

    if (not fs::is_directory(storage_dir))
    {
        LOG_WARN(storage_dir << " does not exist, no objects found");
        return ObjectPaths();
    }

    for (fs::directory_iterator n(storage_dir); n != fs::directory_iterator(); ++n)
    {
        const fs::path node_dir(n->path());
        if (not fs::is_directory(node_dir))
        {
            continue;
        }

        for (fs::recursive_directory_iterator it(node_dir);
             it != fs::recursive_directory_iterator();
             ++it)
        {
            if (it.depth() + 1 == static_cast<int>(depth_))
            {
                if (fs::is_regular_file(it->status()))
                {
                    const std::string rel(it->path().lexically_relative(node_dir).generic_string());
                    if (is_object_path(rel, depth_))
                    {
                        objects.emplace(rel);
                    }
                }
                else if (fs::is_directory(it->status()))
                {
                    it.disable_recursion_pending();
                }
            }
        }
    }

    return ObjectPaths(objects.begin(),
                       objects.end());
}

VerificationReport
CompletenessVerifier::verify(const WorkListFiles& lists,
                             const fs::path& storage_dir) const
{
    std::set<ObjectPath> expected_set;
    for (const auto& p : lists)
    {
        const ObjectPaths objs(WorkListReader::read(p.second.path,
                                                    depth_));
        expected_set.insert(objs.begin(),
                            objs.end());
    }

    const ObjectPaths expected(expected_set.begin(),
                               expected_set.end());
    const ObjectPaths found(collect_objects(storage_dir));

    VerificationReport report;
    report.expected = expected.size();
    report.found = found.size();

    std::set_difference(expected.begin(),
                        expected.end(),
                        found.begin(),
                        found.end(),
                        std::back_inserter(report.missing));

    ObjectPaths unexpected;
    std::set_difference(found.begin(),
                        found.end(),
                        expected.begin(),
                        expected.end(),
                        std::back_inserter(unexpected));
    report.unexpected = unexpected.size();

    if (report.empty())
    {
        LOG_INFO("All " << report.expected << " requested objects are present (" <<
                 report.unexpected << " others found as well)");
    }
    else
    {
        LOG_WARN(report.missing.size() << " of " << report.expected <<
                 " requested objects are missing from " << storage_dir);
    }

    return report;
}

boost::optional<fs::path>
CompletenessVerifier::write_report(const VerificationReport& report,
                                   const fs::path& snapshot)
{
    if (report.empty())
    {
        return boost::none;
    }

    const fs::path p(snapshot / "verification-missing.txt");
    fs::ofstream ofs(p,
                     std::ios::out bitor std::ios::trunc);

    for (const auto& o : report.missing)
    {
        ofs << o << '\n';
    }

    ofs.close();
    if (ofs.fail())
    {
        LOG_ERROR("Failed to write verification report " << p);
        throw WorkListException("Failed to write verification report",
                                p.string().c_str());
    }

    LOG_INFO("Wrote " << report.missing.size() << " missing objects to " << p);
    return p;
}

}

// Local Variables: **
// mode: c++ **
// End: **
