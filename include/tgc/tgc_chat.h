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

#include <cstdint>
#include <string>

// Both basic group chats and channels are delivered in the chats table.
struct tgc_chat {
    int32_t id;
    int64_t access_hash; // channels only
    std::string title;
    std::string username;
    int32_t participants_count;
    bool is_channel;
    bool megagroup;
    bool left;

    tgc_chat()
        : id(0)
        , access_hash(0)
        , participants_count(0)
        , is_channel(false)
        , megagroup(false)
        , left(false)
    { }

    tgc_chat(int32_t id, const std::string& title, int64_t access_hash = 0, bool is_channel = false)
        : id(id)
        , access_hash(access_hash)
        , title(title)
        , participants_count(0)
        , is_channel(is_channel)
        , megagroup(false)
        , left(false)
    { }
};
