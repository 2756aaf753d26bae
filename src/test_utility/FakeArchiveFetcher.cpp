/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "FakeArchiveFetcher.hpp"

#include "context/Archive.hpp"


namespace test_utility {
namespace emulation {

void FakeArchiveFetcher::fetch(const std::string& url, const boost::filesystem::path& destination) const {
    urls.push_back(url);
    auto writer = shipyard::context::ArchiveWriter{destination};
    writer.addEntry(shipyard::context::ArchiveEntry{"qemu-4.0.0.balena2-arm/README", "readme"});
    if(isBinaryIncluded) {
        writer.addEntry(shipyard::context::ArchiveEntry{"qemu-4.0.0.balena2-arm/qemu-arm-static", binaryContent, 0755});
    }
    writer.finalize();
}

}
}
