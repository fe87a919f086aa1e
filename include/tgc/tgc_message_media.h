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

#include "tgc_document.h"
#include "tgc_file_location.h"
#include "tgc_photo.h"

#include <boost/optional.hpp>
#include <boost/variant.hpp>

#include <cstdint>
#include <string>
#include <vector>

enum class tgc_message_media_type {
    none,
    photo,
    document,
    contact,
    unsupported,
};

struct tgc_message_media_none {
};

struct tgc_message_media_photo {
    tgc_photo photo;
    std::string caption;
};

struct tgc_message_media_document {
    tgc_document document;
    std::string caption;
};

struct tgc_message_media_contact {
    std::string phone_number;
    std::string first_name;
    boost::optional<std::string> last_name;
    int32_t user_id;

    tgc_message_media_contact(): user_id(0) { }
    tgc_message_media_contact(const std::string& first_name, const boost::optional<std::string>& last_name,
            const std::string& phone_number)
        : phone_number(phone_number)
        , first_name(first_name)
        , last_name(last_name)
        , user_id(0)
    { }
};

// Geo points, venues, web pages and anything newer than this library.
struct tgc_message_media_unsupported {
};

using tgc_message_media = boost::variant<tgc_message_media_none,
        tgc_message_media_photo,
        tgc_message_media_document,
        tgc_message_media_contact,
        tgc_message_media_unsupported>;

tgc_message_media_type tgc_media_type_of(const tgc_message_media& media);

// Media built from local uploads, as messages.sendMedia takes it.
struct tgc_input_media_uploaded_photo {
    tgc_input_file file;
    std::string caption;
};

struct tgc_input_media_uploaded_document {
    tgc_input_file file;
    std::string mime_type;
    std::vector<tgc_document_attribute> attributes;
    std::string caption;
};

struct tgc_input_media_contact {
    std::string phone_number;
    std::string first_name;
    std::string last_name;
};

using tgc_input_media = boost::variant<tgc_input_media_uploaded_photo,
        tgc_input_media_uploaded_document,
        tgc_input_media_contact>;
