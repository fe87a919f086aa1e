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

#include "tgc_chat.h"
#include "tgc_peer_id.h"
#include "tgc_user.h"

#include <boost/optional.hpp>

#include <string>
#include <vector>

// Users resolve to "first last" or just "first", chats and channels to
// their title.
boost::optional<std::string> tgc_find_display_name(const tgc_peer_t& peer,
        const std::vector<tgc_user>& users, const std::vector<tgc_chat>& chats);

boost::optional<tgc_input_peer_t> tgc_find_input_peer(const tgc_peer_t& peer,
        const std::vector<tgc_user>& users, const std::vector<tgc_chat>& chats);
