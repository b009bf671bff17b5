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

// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

#pragma once

#include "configbase.h"

namespace strata::config {

// log dir
CONF_String(sys_log_dir, "log");
// INFO, WARNING, ERROR, FATAL
CONF_String_enum(sys_log_level, "INFO", "INFO,WARNING,ERROR,FATAL");
// Roll the log file when it grows bigger than this many MB.
CONF_Int32(sys_log_max_size_mb, "1024");
// Verbose log
CONF_Strings(sys_log_verbose_modules, "");
// Verbose log level
CONF_Int32(sys_log_verbose_level, "10");
// Log buffer level, -1 means flush every message.
CONF_String(log_buffer_level, "");

// Top-level rows per page. Fixed for the whole column.
CONF_mInt32(page_rows, "8192");

// Codec used for values blocks when adaptive selection is off, and the
// general purpose codec that adaptive selection compares the lightweight
// encodings against.
CONF_mString_enum(page_default_compression, "LZ4",
                  "NO_COMPRESSION,LZ4,ZSTD,SNAPPY,BIT_PACKING,ROARING,RLE,DICT,ZLIB");

// Choose the values codec of every page from a sample of its data.
CONF_mBool(page_enable_adaptive_compression, "true");

// Codecs adaptive selection may never pick, e.g. "DICT,ROARING".
CONF_mStrings(adaptive_compression_forbidden_codecs, "");

// Values sampled from a page to estimate run lengths, cardinality and range.
CONF_mInt32(adaptive_compression_sample_size, "1024");

// Consecutive values per sampled block. Runs are measured inside a block.
CONF_mInt32(adaptive_compression_sample_block, "64");

// Bytes of a page trial-compressed to estimate general purpose codec ratios.
CONF_mInt32(adaptive_compression_trial_bytes, "8192");

// A codec is only chosen when its estimated size is below this fraction of
// the raw size, otherwise the values are stored uncompressed.
CONF_mDouble(adaptive_compression_max_ratio, "0.9");

// Estimates within this relative distance of the best one count as a tie,
// and the cheaper to decode codec wins.
CONF_mDouble(adaptive_compression_tie_tolerance, "0.05");

// Threads encoding pages of one column in parallel. 0 means the
// number of cores.
CONF_Int32(page_codec_thread_num, "0");

// Pending page tasks per thread before offer() blocks.
CONF_Int32(page_codec_queue_size_per_thread, "4");

} // namespace strata::config
