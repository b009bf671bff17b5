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

#include <cstdint>
#include <unordered_map>
#include <vector>

#include "column/vectorized_fwd.h"
#include "common/status.h"
#include "storage/page/level_codec.h"
#include "types/type_descriptor.h"

namespace strata {

// Level bounds of a nested type.
struct NestedLevelInfo {
    // deepest list or map nesting
    int max_rep_level = 0;
    // largest definition level of any leaf
    int max_def_level = 0;
    // number of list and map nodes, each rebuilds one offsets array
    size_t num_offsets_arrays = 0;
    // leaf types in depth first order
    std::vector<const TypeDescriptor*> leaves;
    std::unordered_map<const TypeDescriptor*, size_t> leaf_index;

    static NestedLevelInfo from_type(const TypeDescriptor& type);
};

// The dense values of one leaf: the rows of |column| listed in |selection|.
struct LeafValues {
    const TypeDescriptor* type = nullptr;
    // non nullable data column of the leaf
    const Column* column = nullptr;
    std::vector<uint32_t> selection;
};

struct ShreddedColumn {
    Levels rep_levels;
    Levels def_levels;
    std::vector<LeafValues> leaves;
    // total offset entries the decoder rebuilds, sum of (rows + 1) over every
    // list or map node
    size_t num_offsets = 0;
    size_t num_rows = 0;
};

// Flattens rows of a list, struct or map column into one repetition stream, one
// definition stream and the dense values of every leaf.
//
// Every slot is one position in both level streams:
//  - a null node, an empty list or map and a leaf each produce one slot
//  - a present node adds one definition level for being non null, a list or map
//    one more for having elements
//  - the first slot of a row has repetition level 0, the first slot of element
//    j > 0 of a list at depth d has d, and the first slot of a struct field
//    after the first has the depth of the innermost enclosing list
// Maps are lists of (key, value) structs.
class NestedShredder {
public:
    explicit NestedShredder(const TypeDescriptor& type);

    // Shred rows [from, from + count) of |column|, which must match the type.
    Status shred(const Column& column, size_t from, size_t count, ShreddedColumn* out) const;

    const NestedLevelInfo& level_info() const { return _info; }

private:
    struct Context;

    void _shred_node(Context* ctx, const TypeDescriptor& type, const Column* column, size_t row, level_t rep,
                     level_t def, level_t list_depth) const;

    void _shred_present(Context* ctx, const TypeDescriptor& type, const Column* column, size_t row, level_t rep,
                        level_t def, level_t list_depth) const;

    void _collect_leaves(const TypeDescriptor& type, const Column* column, std::vector<LeafValues>* leaves) const;

    const TypeDescriptor& _type;
    NestedLevelInfo _info;
};

// Rebuilds a nested column from the streams written by NestedShredder.
class NestedAssembler {
public:
    // |leaves| holds one dense non nullable column per leaf in depth first order.
    NestedAssembler(const TypeDescriptor& type, const Levels& rep_levels, const Levels& def_levels,
                    const Columns& leaves);

    // Append the rows encoded in the streams to |dst|. Returns Corruption when the
    // streams do not describe whole rows of the type, a leaf has too few or too
    // many values, or the rebuilt offsets differ from |expected_offsets|.
    Status assemble(size_t expected_offsets, Column* dst, size_t* num_rows);

private:
    Status _assemble_node(const TypeDescriptor& type, Column* dst, level_t rep, level_t def, level_t list_depth);

    Status _assemble_present(const TypeDescriptor& type, Column* dst, level_t rep, level_t def, level_t list_depth);

    Status _check_slot(level_t rep);

    const TypeDescriptor& _type;
    NestedLevelInfo _info;
    const Levels& _rep_levels;
    const Levels& _def_levels;
    const Columns& _leaves;
    std::vector<size_t> _leaf_cursors;
    size_t _pos = 0;
};

// Sum of (rows + 1) over every array and map column inside |column|.
size_t count_offsets(const Column& column);

} // namespace strata
