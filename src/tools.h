/*
    This file is part of tgc-library

    This library is free software; you can redistribute it and/or
    modify it under the terms of the GNU Lesser General Public
    License as published by the Free Software Foundation; either
    version 2.1 of the License, or (at your option) any later version.

    This library is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
    Lesser General Public License for more details.

    You should have received a copy of the GNU Lesser General Public
    License along with this library; if not, write to the Free Software
    Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA

    Copyright Vitaly Valtman 2013-2015
    Copyright Topology LP 2016-2017
*/

#ifndef __TOOLS_H__
#define __TOOLS_H__

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

static inline int64_t tgc_get_system_time_us()
{
    return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

static inline std::string tgc_binary_to_hex(const unsigned char* buffer, size_t length)
{
    static const char table[16] = {'0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'a', 'b', 'c', 'd', 'e', 'f' };
    std::vector<char> result(length * 2);

    size_t j = 0;
    for (size_t i = 0; i < length; ++i) {
        unsigned char c = buffer[i];
        result[j++] = table[c >> 4];
        result[j++] = table[c & 0xf];
    }

    return std::string(result.data(), result.size());
}

// Microseconds since the epoch, strictly increasing within the process.
int64_t tgc_next_file_id();

// From uname(2). Empty strings when it fails.
std::string tgc_device_model();
std::string tgc_system_version();

#endif
