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

#include "fake_backend.h"
#include "login_manager.h"

#include "tgc/tgc_dc.h"
#include "tgc/tgc_errors.h"

#include <algorithm>

using namespace tgc;
using namespace tgc::test;

static const std::string PHONE = "15551234567";

TEST_CASE("send_code records the code hash once the right data center answers", "[login_manager]") {
    fake_backend backend;
    backend.server->send_code_redirects = { 4, 2, 5 };
    auto client = backend.make_client();
    REQUIRE(client->connect());
    impl::login_manager login(client);

    login.send_code(PHONE);

    REQUIRE(backend.connection_factory->opened_hosts()
            == (std::vector<std::string>{ TG_SERVER_2, dc_address(4), dc_address(2), dc_address(5) }));
    auto code = login.context().sent_code(PHONE);
    REQUIRE(code);
    REQUIRE(code->phone_code_hash == "hash-" + PHONE);
    REQUIRE(code->phone_registered);
}

TEST_CASE("send_code records nothing when redirects run out", "[login_manager]") {
    fake_backend backend;
    backend.config.max_dc_redirects = 1;
    backend.server->send_code_redirects = { 4, 5 };
    auto client = backend.make_client();
    REQUIRE(client->connect());
    impl::login_manager login(client);

    REQUIRE_THROWS_AS(login.send_code(PHONE), tgc_dc_redirect_error);
    REQUIRE_FALSE(login.context().sent_code(PHONE));
}

TEST_CASE("sign_in", "[login_manager]") {
    fake_backend backend;
    auto client = backend.make_client();
    REQUIRE(client->connect());
    impl::login_manager login(client);
    REQUIRE_FALSE(login.is_authorized());

    SECTION("without a requested code") {
        REQUIRE_THROWS_AS(login.sign_in(PHONE, "12345"), tgc_usage_error);
    }

    SECTION("with a wrong code") {
        login.send_code(PHONE);
        int saves = backend.session_store->saves;

        REQUIRE_FALSE(login.sign_in(PHONE, "54321"));
        REQUIRE_FALSE(login.is_authorized());
        REQUIRE_FALSE(client->session()->user);
        REQUIRE(backend.session_store->saves == saves);
        REQUIRE(login.context().sent_code(PHONE));
    }

    SECTION("with the right code") {
        login.send_code(PHONE);

        REQUIRE(login.sign_in(PHONE, "12345"));
        REQUIRE(login.is_authorized());
        REQUIRE(client->session()->user->id == 777);
        REQUIRE(backend.session_store->sessions["test-session"].user);
        REQUIRE(backend.session_store->sessions["test-session"].user->first_name == "Ana");
        REQUIRE_FALSE(login.context().sent_code(PHONE));
        REQUIRE(backend.sender_factory->current()->listening);
    }

    SECTION("with an unrelated server error") {
        login.send_code(PHONE);
        backend.server->sign_in_error = std::make_pair(420, std::string("FLOOD_WAIT_30"));

        REQUIRE_THROWS_AS(login.sign_in(PHONE, "12345"), tgc_rpc_error);
        REQUIRE_FALSE(login.is_authorized());
    }

    SECTION("a migration is not followed") {
        login.send_code(PHONE);
        size_t hosts = backend.connection_factory->opened_hosts().size();
        backend.server->sign_in_error = std::make_pair(303, std::string("PHONE_MIGRATE_4"));

        REQUIRE_THROWS_AS(login.sign_in(PHONE, "12345"), tgc_dc_redirect_error);
        REQUIRE(backend.connection_factory->opened_hosts().size() == hosts);
        REQUIRE(backend.server->queries.back() == "sign in@" + std::string(TG_SERVER_2));
        REQUIRE(std::count(backend.server->queries.begin(), backend.server->queries.end(),
                "sign in@" + std::string(TG_SERVER_2)) == 1);
        REQUIRE_FALSE(login.is_authorized());
        REQUIRE(login.context().sent_code(PHONE));
    }
}

TEST_CASE("log_out forgets the user", "[login_manager]") {
    fake_backend backend;
    auto client = backend.make_client();
    REQUIRE(client->connect());
    impl::login_manager login(client);
    login.send_code(PHONE);
    REQUIRE(login.sign_in(PHONE, "12345"));
    login.send_code("15550000000");

    SECTION("accepted") {
        REQUIRE(login.log_out());
        REQUIRE_FALSE(login.is_authorized());
        REQUIRE_FALSE(backend.session_store->sessions["test-session"].user);
        REQUIRE(login.context().sent_codes.empty());
        REQUIRE_FALSE(backend.sender_factory->current()->listening);
    }

    SECTION("refused") {
        backend.server->logout_result = false;
        REQUIRE_FALSE(login.log_out());
        REQUIRE(login.is_authorized());
    }
}

TEST_CASE("a logged in session listens for updates after reconnecting", "[login_manager]") {
    fake_backend backend;
    tgc_session session = *tgc_session::create("test-session");
    session.user = tgc_user(777, 1, "Ana");
    backend.session_store->sessions["test-session"] = session;

    auto client = backend.make_client();
    impl::login_manager login(client);
    REQUIRE(login.is_authorized());
    REQUIRE(client->connect());
    REQUIRE(backend.sender_factory->current()->listening);
}
