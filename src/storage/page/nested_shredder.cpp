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

#include "storage/page/nested_shredder.h"

#include <fmt/format.h>

#include <algorithm>

#include "column/array_column.h"
#include "column/column_helper.h"
#include "column/map_column.h"
#include "column/nullable_column.h"
#include "column/struct_column.h"
#include "common/logging.h"

namespace strata {

static void visit_levels(const TypeDescriptor& type, int def, int depth, NestedLevelInfo* info) {
    if (type.nullable) {
        ++def;
    }
    switch (type.type) {
    case TYPE_ARRAY:
    case TYPE_LARGE_ARRAY:
    case TYPE_MAP:
        ++info->num_offsets_arrays;
        info->max_rep_level = std::max(info->max_rep_level, depth + 1);
        for (const auto& child : type.children) {
            visit_levels(child, def + 1, depth + 1, info);
        }
        break;
    case TYPE_STRUCT:
        for (const auto& child : type.children) {
            visit_levels(child, def, depth, info);
        }
        break;
    default:
        info->max_def_level = std::max(info->max_def_level, def);
        info->leaf_index.emplace(&type, info->leaves.size());
        info->leaves.push_back(&type);
        break;
    }
}

NestedLevelInfo NestedLevelInfo::from_type(const TypeDescriptor& type) {
    NestedLevelInfo info;
    visit_levels(type, 0, 0, &info);
    return info;
}

// Offsets entries a null or default row of |type| adds when appended to a column.
static size_t default_offsets(const TypeDescriptor& type) {
    switch (type.type) {
    case TYPE_ARRAY:
    case TYPE_LARGE_ARRAY:
    case TYPE_MAP:
        return 1;
    case TYPE_STRUCT: {
        size_t n = 0;
        for (const auto& child : type.children) {
            n += default_offsets(child);
        }
        return n;
    }
    default:
        return 0;
    }
}

size_t count_offsets(const Column& column) {
    const Column* data = ColumnHelper::get_data_column(&column);
    if (data->is_array()) {
        const auto& array = ColumnHelper::as_column<ArrayColumn>(*data);
        return array.size() + 1 + count_offsets(*array.elements_column());
    }
    if (data->is_map()) {
        const auto& map = ColumnHelper::as_column<MapColumn>(*data);
        return map.size() + 1 + count_offsets(*map.keys_column()) + count_offsets(*map.values_column());
    }
    if (data->is_struct()) {
        size_t n = 0;
        for (const auto& field : ColumnHelper::as_column<StructColumn>(*data).fields()) {
            n += count_offsets(*field);
        }
        return n;
    }
    return 0;
}

struct NestedShredder::Context {
    ShreddedColumn* out;
    size_t list_rows = 0;

    void emit(level_t rep, level_t def) {
        out->rep_levels.push_back(rep);
        out->def_levels.push_back(def);
    }
};

NestedShredder::NestedShredder(const TypeDescriptor& type) : _type(type), _info(NestedLevelInfo::from_type(type)) {}

void NestedShredder::_collect_leaves(const TypeDescriptor& type, const Column* column,
                                     std::vector<LeafValues>* leaves) const {
    const Column* data = ColumnHelper::get_data_column(column);
    switch (type.type) {
    case TYPE_ARRAY:
    case TYPE_LARGE_ARRAY:
        _collect_leaves(type.children[0], ColumnHelper::as_column<ArrayColumn>(*data).elements_column().get(),
                        leaves);
        break;
    case TYPE_MAP: {
        const auto& map = ColumnHelper::as_column<MapColumn>(*data);
        _collect_leaves(type.children[0], map.keys_column().get(), leaves);
        _collect_leaves(type.children[1], map.values_column().get(), leaves);
        break;
    }
    case TYPE_STRUCT: {
        const auto& st = ColumnHelper::as_column<StructColumn>(*data);
        for (size_t i = 0; i < type.children.size(); ++i) {
            _collect_leaves(type.children[i], st.field_column(i).get(), leaves);
        }
        break;
    }
    default: {
        LeafValues leaf;
        leaf.type = &type;
        leaf.column = data;
        leaves->push_back(std::move(leaf));
        break;
    }
    }
}

Status NestedShredder::shred(const Column& column, size_t from, size_t count, ShreddedColumn* out) const {
    if (!_type.is_complex_type()) {
        return Status::InvalidArgument(fmt::format("{} is not a nested type", _type.debug_string()));
    }
    RETURN_IF_ERROR(ColumnHelper::check_column_type(column, _type));
    if (from + count > column.size()) {
        return Status::InvalidArgument(
                fmt::format("rows [{}, {}) out of a column of {} rows", from, from + count, column.size()));
    }
    out->rep_levels.clear();
    out->def_levels.clear();
    out->leaves.clear();
    _collect_leaves(_type, &column, &out->leaves);
    DCHECK_EQ(out->leaves.size(), _info.leaves.size());

    Context ctx{out};
    for (size_t row = from; row < from + count; ++row) {
        _shred_node(&ctx, _type, &column, row, 0, 0, 0);
    }
    out->num_rows = count;
    out->num_offsets = ctx.list_rows + _info.num_offsets_arrays;
    return Status::OK();
}

void NestedShredder::_shred_node(Context* ctx, const TypeDescriptor& type, const Column* column, size_t row,
                                 level_t rep, level_t def, level_t list_depth) const {
    if (type.type == TYPE_NULL) {
        ctx->emit(rep, def);
        return;
    }
    const Column* data = column;
    if (type.nullable) {
        if (column->is_nullable()) {
            if (column->is_null(row)) {
                ctx->emit(rep, def);
                ctx->list_rows += default_offsets(type);
                return;
            }
            data = ColumnHelper::get_data_column(column);
        }
        ++def;
    }
    _shred_present(ctx, type, data, row, rep, def, list_depth);
}

void NestedShredder::_shred_present(Context* ctx, const TypeDescriptor& type, const Column* column, size_t row,
                                    level_t rep, level_t def, level_t list_depth) const {
    switch (type.type) {
    case TYPE_ARRAY:
    case TYPE_LARGE_ARRAY: {
        const auto& array = ColumnHelper::as_column<ArrayColumn>(*column);
        ++ctx->list_rows;
        const size_t offset = array.get_element_offset(row);
        const size_t size = array.get_element_size(row);
        if (size == 0) {
            ctx->emit(rep, def);
            return;
        }
        const level_t depth = list_depth + 1;
        const Column* elements = array.elements_column().get();
        for (size_t j = 0; j < size; ++j) {
            _shred_node(ctx, type.children[0], elements, offset + j, j == 0 ? rep : depth, def + 1, depth);
        }
        break;
    }
    case TYPE_MAP: {
        const auto& map = ColumnHelper::as_column<MapColumn>(*column);
        ++ctx->list_rows;
        const size_t offset = map.get_map_offset(row);
        const size_t size = map.get_map_size(row);
        if (size == 0) {
            ctx->emit(rep, def);
            return;
        }
        const level_t depth = list_depth + 1;
        for (size_t j = 0; j < size; ++j) {
            _shred_node(ctx, type.children[0], map.keys_column().get(), offset + j, j == 0 ? rep : depth, def + 1,
                        depth);
            _shred_node(ctx, type.children[1], map.values_column().get(), offset + j, depth, def + 1, depth);
        }
        break;
    }
    case TYPE_STRUCT: {
        const auto& st = ColumnHelper::as_column<StructColumn>(*column);
        for (size_t i = 0; i < type.children.size(); ++i) {
            _shred_node(ctx, type.children[i], st.field_column(i).get(), row, i == 0 ? rep : list_depth, def,
                        list_depth);
        }
        break;
    }
    default: {
        ctx->emit(rep, def);
        auto it = _info.leaf_index.find(&type);
        DCHECK(it != _info.leaf_index.end());
        ctx->out->leaves[it->second].selection.push_back(static_cast<uint32_t>(row));
        break;
    }
    }
}

NestedAssembler::NestedAssembler(const TypeDescriptor& type, const Levels& rep_levels, const Levels& def_levels,
                                 const Columns& leaves)
        : _type(type),
          _info(NestedLevelInfo::from_type(type)),
          _rep_levels(rep_levels),
          _def_levels(def_levels),
          _leaves(leaves),
          _leaf_cursors(leaves.size(), 0) {}

Status NestedAssembler::assemble(size_t expected_offsets, Column* dst, size_t* num_rows) {
    if (_rep_levels.size() != _def_levels.size()) {
        return Status::Corruption(fmt::format("{} repetition levels but {} definition levels", _rep_levels.size(),
                                              _def_levels.size()));
    }
    if (_leaves.size() != _info.leaves.size()) {
        return Status::Corruption(
                fmt::format("{} values blocks for a type with {} leaves", _leaves.size(), _info.leaves.size()));
    }
    const size_t offsets_before = count_offsets(*dst);
    size_t rows = 0;
    while (_pos < _rep_levels.size()) {
        RETURN_IF_ERROR(_assemble_node(_type, dst, 0, 0, 0));
        ++rows;
    }
    for (size_t i = 0; i < _leaves.size(); ++i) {
        if (_leaf_cursors[i] != _leaves[i]->size()) {
            return Status::Corruption(fmt::format("leaf {} has {} values, levels reference {}", i,
                                                  _leaves[i]->size(), _leaf_cursors[i]));
        }
    }
    const size_t num_offsets = count_offsets(*dst) - offsets_before + _info.num_offsets_arrays;
    if (num_offsets != expected_offsets) {
        return Status::Corruption(
                fmt::format("rebuilt {} offsets, page declares {}", num_offsets, expected_offsets));
    }
    *num_rows = rows;
    return Status::OK();
}

Status NestedAssembler::_check_slot(level_t rep) {
    if (_pos >= _rep_levels.size()) {
        return Status::Corruption(fmt::format("levels end inside a row after {} slots", _pos));
    }
    if (_rep_levels[_pos] != rep) {
        return Status::Corruption(
                fmt::format("slot {} has repetition level {}, expected {}", _pos, _rep_levels[_pos], rep));
    }
    return Status::OK();
}

Status NestedAssembler::_assemble_node(const TypeDescriptor& type, Column* dst, level_t rep, level_t def,
                                       level_t list_depth) {
    RETURN_IF_ERROR(_check_slot(rep));
    const level_t level = _def_levels[_pos];
    if (level < def) {
        return Status::Corruption(fmt::format("slot {} has definition level {} below its parent's {}", _pos, level,
                                              def));
    }
    if (type.type == TYPE_NULL) {
        if (level != def) {
            return Status::Corruption(fmt::format("slot {} defines a value of the null type", _pos));
        }
        ++_pos;
        dst->append_nulls(1);
        return Status::OK();
    }
    if (!type.nullable) {
        return _assemble_present(type, dst, rep, def, list_depth);
    }
    auto* nullable = static_cast<NullableColumn*>(dst);
    if (level == def) {
        ++_pos;
        nullable->append_nulls(1);
        return Status::OK();
    }
    RETURN_IF_ERROR(_assemble_present(type, nullable->mutable_data_column(), rep, def + 1, list_depth));
    nullable->null_column_data().emplace_back(0);
    return Status::OK();
}

Status NestedAssembler::_assemble_present(const TypeDescriptor& type, Column* dst, level_t rep, level_t def,
                                          level_t list_depth) {
    const level_t level = _def_levels[_pos];
    switch (type.type) {
    case TYPE_ARRAY:
    case TYPE_LARGE_ARRAY: {
        auto* array = static_cast<ArrayColumn*>(dst);
        if (level == def) {
            ++_pos;
            array->append_default();
            return Status::OK();
        }
        const level_t depth = list_depth + 1;
        level_t element_rep = rep;
        do {
            RETURN_IF_ERROR(
                    _assemble_node(type.children[0], array->mutable_elements_column(), element_rep, def + 1, depth));
            element_rep = depth;
        } while (_pos < _rep_levels.size() && _rep_levels[_pos] == depth);
        array->finish_row();
        return Status::OK();
    }
    case TYPE_MAP: {
        auto* map = static_cast<MapColumn*>(dst);
        if (level == def) {
            ++_pos;
            map->append_default();
            return Status::OK();
        }
        const level_t depth = list_depth + 1;
        level_t entry_rep = rep;
        do {
            RETURN_IF_ERROR(_assemble_node(type.children[0], map->keys_column().get(), entry_rep, def + 1, depth));
            RETURN_IF_ERROR(_assemble_node(type.children[1], map->values_column().get(), depth, def + 1, depth));
            entry_rep = depth;
        } while (_pos < _rep_levels.size() && _rep_levels[_pos] == depth);
        map->finish_row();
        return Status::OK();
    }
    case TYPE_STRUCT: {
        auto* st = static_cast<StructColumn*>(dst);
        for (size_t i = 0; i < type.children.size(); ++i) {
            RETURN_IF_ERROR(_assemble_node(type.children[i], st->fields_column()[i].get(), i == 0 ? rep : list_depth,
                                           def, list_depth));
        }
        return Status::OK();
    }
    default: {
        if (level != def) {
            return Status::Corruption(fmt::format("slot {} has definition level {}, leaf {} expects {}", _pos, level,
                                                  type.debug_string(), def));
        }
        ++_pos;
        const size_t leaf = _info.leaf_index.at(&type);
        if (_leaf_cursors[leaf] >= _leaves[leaf]->size()) {
            return Status::Corruption(
                    fmt::format("leaf {} runs out of values at {}", leaf, _leaves[leaf]->size()));
        }
        dst->append(*_leaves[leaf], _leaf_cursors[leaf]++, 1);
        return Status::OK();
    }
    }
}

} // namespace strata
