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

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>

#include "common/logging.h"

namespace strata {

// A faster alternative to std::string for byte buffers: resize() does not
// zero the new bytes and growth is geometric.
class faststring {
public:
    enum { kInitialCapacity = 32 };

    faststring() : _data(_initial_data), _capacity(kInitialCapacity) {}

    // Construct a string with the given capacity, in bytes.
    explicit faststring(size_t capacity) : faststring() {
        if (capacity > kInitialCapacity) {
            _data = new uint8_t[capacity];
            _capacity = capacity;
        }
    }

    faststring(const faststring&) = delete;
    const faststring& operator=(const faststring&) = delete;

    faststring(faststring&& other) noexcept : faststring() { *this = std::move(other); }

    faststring& operator=(faststring&& other) noexcept {
        if (this == &other) {
            return *this;
        }
        if (_data != _initial_data) {
            delete[] _data;
        }
        if (other._data == other._initial_data) {
            memcpy(_initial_data, other._initial_data, other._len);
            _data = _initial_data;
            _capacity = kInitialCapacity;
        } else {
            _data = other._data;
            _capacity = other._capacity;
        }
        _len = other._len;
        other._data = other._initial_data;
        other._capacity = kInitialCapacity;
        other._len = 0;
        return *this;
    }

    ~faststring() {
        if (_data != _initial_data) {
            delete[] _data;
        }
    }

    // Reset the valid length of the string to 0.
    //
    // This does not free up any memory. The capacity of the string remains unchanged.
    void clear() { _len = 0; }

    // Resize the string to the given length. If the new length is larger than the
    // old one, the new bytes are left uninitialized.
    void resize(size_t newsize) {
        if (newsize > _capacity) {
            reserve(newsize);
        }
        _len = newsize;
    }

    // Reserve space for the given total amount of data. If the current capacity
    // is already larger than the newly requested capacity, this is a no-op.
    void reserve(size_t newcapacity) {
        if (newcapacity <= _capacity) return;
        grow_array(newcapacity);
    }

    // Append the given data to the string, resizing capacity as necessary.
    void append(const void* src_v, size_t count) {
        const auto* src = reinterpret_cast<const uint8_t*>(src_v);
        ensure_room_for_append(count);
        if (count > 0) {
            memcpy(&_data[_len], src, count);
        }
        _len += count;
    }

    void append(const std::string& src) { append(src.data(), src.size()); }

    void push_back(const char byte) {
        ensure_room_for_append(1);
        _data[_len] = byte;
        _len++;
    }

    size_t length() const { return _len; }

    size_t size() const { return _len; }

    size_t capacity() const { return _capacity; }

    const uint8_t* data() const { return &_data[0]; }

    uint8_t* data() { return &_data[0]; }

    const uint8_t& at(size_t i) const { return _data[i]; }

    const uint8_t& operator[](size_t i) const { return _data[i]; }

    uint8_t& operator[](size_t i) { return _data[i]; }

    std::string ToString() const { return {reinterpret_cast<const char*>(data()), _len}; }

private:
    // If necessary, expand the buffer to fit at least 'count' more bytes.
    // If the array has to be grown, it is grown by at least 50%.
    void ensure_room_for_append(size_t count) {
        if (_len + count > _capacity) {
            expand_to_at_least(_len + count);
        }
    }

    void expand_to_at_least(size_t newcapacity) {
        newcapacity = std::max(newcapacity, _capacity * 3 / 2);
        grow_array(newcapacity);
    }

    void grow_array(size_t newcapacity) {
        DCHECK_GE(newcapacity, _capacity);
        std::unique_ptr<uint8_t[]> newdata(new uint8_t[newcapacity]);
        if (_len > 0) {
            memcpy(&newdata[0], &_data[0], _len);
        }
        if (_data != _initial_data) {
            delete[] _data;
        }
        _data = newdata.release();
        _capacity = newcapacity;
    }

    uint8_t* _data;
    uint8_t _initial_data[kInitialCapacity];
    size_t _len = 0;
    size_t _capacity;
};

} // namespace strata
