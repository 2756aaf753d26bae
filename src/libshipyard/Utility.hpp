/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libshipyard_Utility_hpp
#define libshipyard_Utility_hpp


#include "libshipyard/utility/environment.hpp"
#include "libshipyard/utility/filesystem.hpp"
#include "libshipyard/utility/json.hpp"
#include "libshipyard/utility/logging.hpp"
#include "libshipyard/utility/process.hpp"
#include "libshipyard/utility/string.hpp"

#endif
