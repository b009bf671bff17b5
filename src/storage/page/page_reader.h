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

#include "column/vectorized_fwd.h"
#include "common/statusor.h"
#include "types/type_descriptor.h"
#include "util/slice.h"

namespace strata {

struct PageData {
    ColumnPtr column;
    size_t num_rows = 0;
};

// PageReader decodes one page written by PageWriter. The page is read in a single
// pass, each values block is decompressed once and nothing outside |page| is
// touched. Errors:
//  - TruncatedPage: a declared length runs past the end of the page
//  - UnsupportedCodec: a values block uses a codec id this build does not know
//  - Corruption: any other inconsistency, including bytes after the last block
class PageReader {
public:
    static StatusOr<PageData> read(const Slice& page, const TypeDescriptor& type);

    // Append the rows of |page| to |dst|. InvalidArgument when |dst| is not a
    // column create_column(type) could have built.
    static Status read(const Slice& page, const TypeDescriptor& type, Column* dst, size_t* num_rows);
};

} // namespace strata
