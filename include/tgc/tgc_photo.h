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

    Copyright Vitaly Valtman 2014-2015
    Copyright Topology LP 2016
*/

#pragma once

#include "tgc_file_location.h"

#include <cstdint>
#include <string>
#include <vector>

struct tgc_photo_size {
    std::string type;
    tgc_input_file_location location;
    int32_t width;
    int32_t height;
    int32_t size;

    tgc_photo_size(): width(0), height(0), size(0) { }
};

struct tgc_photo {
    int64_t id;
    int64_t access_hash;
    int32_t date;
    std::vector<tgc_photo_size> sizes; // smallest first

    tgc_photo(): id(0), access_hash(0), date(0) { }
};
