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

#ifndef TGC_FILE_LOCATION
#define TGC_FILE_LOCATION

#include <boost/variant.hpp>

#include <cstdint>
#include <string>
#include <vector>

// Photos and other files stored by volume.
struct tgc_input_file_location {
    int64_t volume_id;
    int32_t local_id;
    int64_t secret;

    tgc_input_file_location(): volume_id(0), local_id(0), secret(0) { }
    tgc_input_file_location(int64_t volume_id, int32_t local_id, int64_t secret)
        : volume_id(volume_id), local_id(local_id), secret(secret)
    { }
};

struct tgc_input_document_file_location {
    int64_t id;
    int64_t access_hash;
    int32_t version;

    tgc_input_document_file_location(): id(0), access_hash(0), version(0) { }
    tgc_input_document_file_location(int64_t id, int64_t access_hash, int32_t version)
        : id(id), access_hash(access_hash), version(version)
    { }
};

using tgc_file_location = boost::variant<tgc_input_file_location, tgc_input_document_file_location>;

enum class tgc_storage_file_type {
    unknown,
    partial,
    jpeg,
    gif,
    png,
    pdf,
    mp3,
    mov,
    mp4,
    webp,
};

std::string to_string(tgc_storage_file_type type);

// One chunk returned by upload.getFile. An empty bytes vector marks the end.
struct tgc_upload_file {
    tgc_storage_file_type type;
    int32_t mtime;
    std::vector<char> bytes;

    tgc_upload_file(): type(tgc_storage_file_type::unknown), mtime(0) { }
};

// A fully uploaded file, ready to be attached to a media query.
struct tgc_input_file {
    int64_t id;
    int32_t parts;
    std::string name;
    std::string md5_checksum;

    tgc_input_file(): id(0), parts(0) { }
};

#endif // TGC_FILE_LOCATION
