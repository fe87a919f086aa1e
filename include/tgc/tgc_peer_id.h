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
#include <iosfwd>

enum class tgc_peer_type {
    unknown = 0,
    user = 1,
    chat = 2,
    channel = 5,
};

// Peers as they are referenced from inbound messages and dialogs.
struct tgc_peer_user {
    int32_t user_id;
    explicit tgc_peer_user(int32_t id = 0): user_id(id) { }
};

struct tgc_peer_chat {
    int32_t chat_id;
    explicit tgc_peer_chat(int32_t id = 0): chat_id(id) { }
};

struct tgc_peer_channel {
    int32_t channel_id;
    explicit tgc_peer_channel(int32_t id = 0): channel_id(id) { }
};

using tgc_peer_t = boost::variant<tgc_peer_user, tgc_peer_chat, tgc_peer_channel>;

inline bool operator==(const tgc_peer_user& lhs, const tgc_peer_user& rhs) { return lhs.user_id == rhs.user_id; }
inline bool operator==(const tgc_peer_chat& lhs, const tgc_peer_chat& rhs) { return lhs.chat_id == rhs.chat_id; }
inline bool operator==(const tgc_peer_channel& lhs, const tgc_peer_channel& rhs) { return lhs.channel_id == rhs.channel_id; }

tgc_peer_type tgc_peer_type_of(const tgc_peer_t& peer);
int32_t tgc_peer_id_of(const tgc_peer_t& peer);

// Peers in the form outgoing queries address them.
struct tgc_input_peer_empty {
};

struct tgc_input_peer_user {
    int32_t user_id;
    int64_t access_hash;
    tgc_input_peer_user(): user_id(0), access_hash(0) { }
    tgc_input_peer_user(int32_t id, int64_t hash): user_id(id), access_hash(hash) { }
};

struct tgc_input_peer_chat {
    int32_t chat_id;
    explicit tgc_input_peer_chat(int32_t id = 0): chat_id(id) { }
};

struct tgc_input_peer_channel {
    int32_t channel_id;
    int64_t access_hash;
    tgc_input_peer_channel(): channel_id(0), access_hash(0) { }
    tgc_input_peer_channel(int32_t id, int64_t hash): channel_id(id), access_hash(hash) { }
};

using tgc_input_peer_t = boost::variant<tgc_input_peer_empty, tgc_input_peer_user, tgc_input_peer_chat, tgc_input_peer_channel>;

inline bool operator==(const tgc_input_peer_empty&, const tgc_input_peer_empty&) { return true; }

inline bool operator==(const tgc_input_peer_user& lhs, const tgc_input_peer_user& rhs)
{
    return lhs.user_id == rhs.user_id && lhs.access_hash == rhs.access_hash;
}

inline bool operator==(const tgc_input_peer_chat& lhs, const tgc_input_peer_chat& rhs)
{
    return lhs.chat_id == rhs.chat_id;
}

inline bool operator==(const tgc_input_peer_channel& lhs, const tgc_input_peer_channel& rhs)
{
    return lhs.channel_id == rhs.channel_id && lhs.access_hash == rhs.access_hash;
}

tgc_peer_type tgc_peer_type_of(const tgc_input_peer_t& peer);
bool tgc_is_empty(const tgc_input_peer_t& peer);

std::ostream& operator<<(std::ostream& os, const tgc_peer_t& peer);
std::ostream& operator<<(std::ostream& os, const tgc_input_peer_t& peer);
