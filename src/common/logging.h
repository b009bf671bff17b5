// Copyright 2021-present StarRocks, Inc. All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <glog/logging.h>

namespace strata {

// Verbose levels used by the page codec.
#define VLOG_CODEC VLOG(2)
#define VLOG_PAGE VLOG(3)
#define VLOG_CODEC_IS_ON VLOG_IS_ON(2)

// Initialize glog from the log related configs. Safe to call more than once,
// only the first call takes effect.
// Return false if the configs are invalid.
bool init_glog(const char* basename, bool install_signal_handler = false);

// Flush and shut down glog. Does nothing if init_glog was never called.
void shutdown_logging();

} // namespace strata
