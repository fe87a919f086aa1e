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

#include <catch2/catch.hpp>

#include "printers.h"

#include "tgc/tgc_peer_resolver.h"

#include <sstream>

using namespace tgc;

namespace {

std::vector<tgc_user> users()
{
    return {
        tgc_user(1, 101, "Ana", std::string("Ruiz")),
        tgc_user(2, 102, "Bo"),
        tgc_user(1, 999, "Shadowed"),
    };
}

std::vector<tgc_chat> chats()
{
    return {
        tgc_chat(10, "Book club"),
        tgc_chat(20, "Announcements", 2020, true),
    };
}

}

TEST_CASE("display names", "[peer_resolver]") {
    REQUIRE(tgc_find_display_name(tgc_peer_user(1), users(), chats()) == std::string("Ana Ruiz"));
    REQUIRE(tgc_find_display_name(tgc_peer_user(2), users(), chats()) == std::string("Bo"));
    REQUIRE(tgc_find_display_name(tgc_peer_chat(10), users(), chats()) == std::string("Book club"));
    REQUIRE(tgc_find_display_name(tgc_peer_channel(20), users(), chats()) == std::string("Announcements"));

    SECTION("unknown peers") {
        REQUIRE_FALSE(tgc_find_display_name(tgc_peer_user(3), users(), chats()));
        REQUIRE_FALSE(tgc_find_display_name(tgc_peer_chat(1), users(), chats()));
        REQUIRE_FALSE(tgc_find_display_name(tgc_peer_channel(10), {}, {}));
    }
}

TEST_CASE("input peers", "[peer_resolver]") {
    SECTION("a user keeps its access hash") {
        auto peer = tgc_find_input_peer(tgc_peer_user(1), users(), chats());
        REQUIRE(peer);
        const auto& user = boost::get<tgc_input_peer_user>(*peer);
        REQUIRE(user.user_id == 1);
        REQUIRE(user.access_hash == 101);
    }

    SECTION("a chat") {
        auto peer = tgc_find_input_peer(tgc_peer_chat(10), users(), chats());
        REQUIRE(peer);
        REQUIRE(boost::get<tgc_input_peer_chat>(*peer).chat_id == 10);
        REQUIRE(tgc_peer_type_of(*peer) == tgc_peer_type::chat);
    }

    SECTION("a channel") {
        auto peer = tgc_find_input_peer(tgc_peer_channel(20), users(), chats());
        REQUIRE(peer);
        const auto& channel = boost::get<tgc_input_peer_channel>(*peer);
        REQUIRE(channel.channel_id == 20);
        REQUIRE(channel.access_hash == 2020);
    }

    SECTION("unknown peers") {
        REQUIRE_FALSE(tgc_find_input_peer(tgc_peer_user(42), users(), chats()));
        REQUIRE_FALSE(tgc_find_input_peer(tgc_peer_channel(10), users(), {}));
    }
}

TEST_CASE("peer kinds, ids and printing", "[peer_resolver]") {
    REQUIRE(tgc_peer_type_of(tgc_peer_t(tgc_peer_user(1))) == tgc_peer_type::user);
    REQUIRE(tgc_peer_type_of(tgc_peer_t(tgc_peer_channel(3))) == tgc_peer_type::channel);
    REQUIRE(tgc_peer_id_of(tgc_peer_chat(10)) == 10);
    REQUIRE(tgc_peer_id_of(tgc_peer_channel(20)) == 20);

    REQUIRE(tgc_is_empty(tgc_input_peer_empty()));
    REQUIRE_FALSE(tgc_is_empty(tgc_input_peer_chat(10)));

    std::ostringstream os;
    os << tgc_peer_t(tgc_peer_channel(20)) << " " << tgc_input_peer_t(tgc_input_peer_user(1, 101));
    REQUIRE(os.str() == "peer_channel(20) input_peer_user(1, 101)");
}
