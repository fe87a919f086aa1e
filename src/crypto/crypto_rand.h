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

#pragma once

#include <cstddef>
#include <cstdint>

// Fills the buffer from OpenSSL's generator. Throws std::runtime_error when
// it has not been seeded.
void tgc_secure_random(unsigned char* buffer, size_t length);

template<typename IntegerType>
static inline IntegerType tgc_secure_random()
{
    IntegerType value;
    tgc_secure_random(reinterpret_cast<unsigned char*>(&value), sizeof(value));
    return value;
}
