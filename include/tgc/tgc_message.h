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

#include "tgc_chat.h"
#include "tgc_message_entity.h"
#include "tgc_message_media.h"
#include "tgc_peer_id.h"
#include "tgc_user.h"

#include <boost/optional.hpp>

#include <cstdint>
#include <string>
#include <vector>

struct tgc_message {
    int32_t id;
    int32_t from_id;
    tgc_peer_t to_id;
    int32_t date;
    bool out;
    std::string text;
    std::vector<tgc_message_entity> entities;
    tgc_message_media media;

    tgc_message(): id(0), from_id(0), date(0), out(false) { }
};

struct tgc_dialog {
    tgc_peer_t peer;
    int32_t top_message;
    int32_t unread_count;

    tgc_dialog(): top_message(0), unread_count(0) { }
    explicit tgc_dialog(const tgc_peer_t& peer, int32_t top_message = 0, int32_t unread_count = 0)
        : peer(peer), top_message(top_message), unread_count(unread_count)
    { }
};

// messages.Dialogs and messages.DialogsSlice.
struct tgc_messages_dialogs {
    std::vector<tgc_dialog> dialogs;
    std::vector<tgc_message> messages;
    std::vector<tgc_chat> chats;
    std::vector<tgc_user> users;
};

// messages.Messages and messages.MessagesSlice. Only slices carry a count.
struct tgc_messages_messages {
    boost::optional<int32_t> count;
    std::vector<tgc_message> messages;
    std::vector<tgc_chat> chats;
    std::vector<tgc_user> users;
};

// The parts of the Updates answer a caller of send message cares about.
struct tgc_sent_message {
    int32_t id;
    int32_t date;

    tgc_sent_message(): id(0), date(0) { }
    tgc_sent_message(int32_t id, int32_t date): id(id), date(date) { }
};
