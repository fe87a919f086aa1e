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

#include <boost/optional.hpp>

#include <cstdint>
#include <string>

struct tgc_user {
    int32_t id;
    int64_t access_hash;
    std::string first_name;
    boost::optional<std::string> last_name;
    std::string user_name;
    std::string phone_number;
    bool is_self;
    bool is_bot;

    tgc_user()
        : id(0)
        , access_hash(0)
        , is_self(false)
        , is_bot(false)
    { }

    tgc_user(int32_t id, int64_t access_hash, const std::string& first_name,
            const boost::optional<std::string>& last_name = boost::none)
        : id(id)
        , access_hash(access_hash)
        , first_name(first_name)
        , last_name(last_name)
        , is_self(false)
        , is_bot(false)
    { }
};
