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

#include <boost/variant.hpp>

#include <cstdint>
#include <string>
#include <vector>

struct tgc_document_attribute_filename {
    std::string file_name;
    explicit tgc_document_attribute_filename(const std::string& name = std::string()): file_name(name) { }
};

struct tgc_document_attribute_audio {
    int32_t duration;
    std::string title;
    std::string performer;
    tgc_document_attribute_audio(): duration(0) { }
};

struct tgc_document_attribute_image_size {
    int32_t width;
    int32_t height;
    tgc_document_attribute_image_size(): width(0), height(0) { }
};

// Stickers, animations, videos: carried but not interpreted here.
struct tgc_document_attribute_other {
    std::string name;
};

using tgc_document_attribute = boost::variant<tgc_document_attribute_filename,
        tgc_document_attribute_audio,
        tgc_document_attribute_image_size,
        tgc_document_attribute_other>;

struct tgc_document {
    int64_t id;
    int64_t access_hash;
    int32_t version;
    int32_t date;
    int32_t size;
    int32_t dc_id;
    std::string mime_type;
    std::vector<tgc_document_attribute> attributes;

    tgc_document(): id(0), access_hash(0), version(0), date(0), size(0), dc_id(0) { }
};
