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

#include "tgc/tgc_file_location.h"

#include <cassert>

std::string to_string(tgc_storage_file_type type)
{
    switch (type) {
    case tgc_storage_file_type::unknown:
        return "unknown";
    case tgc_storage_file_type::partial:
        return "partial";
    case tgc_storage_file_type::jpeg:
        return "jpeg";
    case tgc_storage_file_type::gif:
        return "gif";
    case tgc_storage_file_type::png:
        return "png";
    case tgc_storage_file_type::pdf:
        return "pdf";
    case tgc_storage_file_type::mp3:
        return "mp3";
    case tgc_storage_file_type::mov:
        return "mov";
    case tgc_storage_file_type::mp4:
        return "mp4";
    case tgc_storage_file_type::webp:
        return "webp";
    }

    assert(false);
    return "unknown";
}
