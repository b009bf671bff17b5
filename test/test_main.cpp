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

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>

#include "common/config.h"
#include "common/logging.h"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    std::error_code ec;
    auto test_home = std::filesystem::temp_directory_path(ec) / "strata_ut";
    if (ec) {
        fprintf(stderr, "no temp directory: %s\n", ec.message().c_str());
        return -1;
    }
    std::filesystem::create_directories(test_home / "log", ec);
    if (ec) {
        fprintf(stderr, "create %s failed: %s\n", test_home.c_str(), ec.message().c_str());
        return -1;
    }
    // strata.conf puts the logs under ${STRATA_HOME}
    setenv("STRATA_HOME", test_home.c_str(), 0);

    std::string conffile = std::string(STRATA_CONF_DIR) + "/strata.conf";
    if (!strata::config::init(conffile.c_str())) {
        fprintf(stderr, "error read config file %s\n", conffile.c_str());
        return -1;
    }
    if (!strata::init_glog("strata_test", true)) {
        fprintf(stderr, "init glog failed\n");
        return -1;
    }

    int r = RUN_ALL_TESTS();

    strata::shutdown_logging();
    return r;
}
