/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_test_utility_FakeArchiveFetcher_hpp
#define shipyard_test_utility_FakeArchiveFetcher_hpp

#include <string>
#include <vector>

#include "emulation/ArchiveFetcher.hpp"


namespace test_utility {
namespace emulation {

/**
 * Serves a release archive of the arm emulator, as published for v4.0.0+balena2.
 */
class FakeArchiveFetcher : public shipyard::emulation::ArchiveFetcher {
public:
    void fetch(const std::string& url, const boost::filesystem::path& destination) const override;

public:
    bool isBinaryIncluded = true;
    std::string binaryContent = "arm emulator";
    mutable std::vector<std::string> urls;
};

}
}

#endif
