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

#include "tgc/tgc_dc.h"
#include "tgc/tgc_errors.h"

using namespace tgc;
using namespace tgc::test;

TEST_CASE("connect negotiates an auth key for a new session", "[mtproto_client]") {
    fake_backend backend;
    auto client = backend.make_client();

    REQUIRE_FALSE(client->session()->has_auth_key());
    REQUIRE(client->connect());
    REQUIRE(client->is_connected());

    REQUIRE(backend.authenticator->negotiations == 1);
    REQUIRE(client->session()->has_auth_key());
    REQUIRE(client->session()->time_offset == 1.5);
    REQUIRE(backend.session_store->sessions.count("test-session") == 1);
    REQUIRE(backend.session_store->sessions["test-session"].has_auth_key());

    REQUIRE(backend.server->layer == backend.config.layer);
    REQUIRE(backend.server->api_id == 12345);
    REQUIRE(backend.connection_factory->opened_hosts() == std::vector<std::string>{ TG_SERVER_2 });
    REQUIRE(client->dc_options().size() == 5);
}

TEST_CASE("connect keeps an existing auth key unless forced", "[mtproto_client]") {
    fake_backend backend;
    auto client = backend.make_client();
    REQUIRE(client->connect());
    auto key = *client->session()->auth_key;

    client->disconnect();
    REQUIRE_FALSE(client->is_connected());

    REQUIRE(client->connect());
    REQUIRE(backend.authenticator->negotiations == 1);
    REQUIRE(*client->session()->auth_key == key);

    REQUIRE(client->connect(true));
    REQUIRE(backend.authenticator->negotiations == 2);
    REQUIRE_FALSE(*client->session()->auth_key == key);
}

TEST_CASE("connect reports failures instead of throwing", "[mtproto_client]") {
    fake_backend backend;

    SECTION("unreachable server") {
        backend.connection_factory->reachable = false;
        auto client = backend.make_client();
        REQUIRE_FALSE(client->connect());
        REQUIRE_FALSE(client->is_connected());
        REQUIRE(backend.authenticator->negotiations == 0);
    }

    SECTION("failed handshake") {
        backend.authenticator->fail = true;
        auto client = backend.make_client();
        REQUIRE_FALSE(client->connect());
        REQUIRE_FALSE(client->is_connected());
        REQUIRE_FALSE(client->session()->has_auth_key());
    }

    SECTION("remote error while setting up the layer") {
        backend.server->config_error = std::make_pair(400, std::string("API_ID_INVALID"));
        auto client = backend.make_client();
        REQUIRE_FALSE(client->connect());
        REQUIRE_FALSE(client->is_connected());
        REQUIRE(backend.sender_factory->current()->disconnected);
    }
}

TEST_CASE("invoke needs a query and a connection", "[mtproto_client]") {
    fake_backend backend;
    auto client = backend.make_client();

    REQUIRE_THROWS_AS(client->invoke(std::make_shared<query_logout>()), tgc_usage_error);

    REQUIRE(client->connect());
    REQUIRE_THROWS_AS(client->invoke(std::shared_ptr<query_logout>()), tgc_usage_error);
    REQUIRE(client->invoke(std::make_shared<query_logout>()));
}

TEST_CASE("remote errors are raised as exceptions", "[mtproto_client]") {
    fake_backend backend;
    backend.server->send_code_redirects.push_back(3);
    auto client = backend.make_client();
    REQUIRE(client->connect());

    try {
        client->invoke(std::make_shared<query_send_code>("15551234567", 1, "hash"));
        FAIL("expected a redirect");
    } catch (const tgc_dc_redirect_error& e) {
        REQUIRE(e.error_code() == 303);
        REQUIRE(e.error_string() == "PHONE_MIGRATE_3");
        REQUIRE(e.new_dc() == 3);
    }

    backend.server->sign_in_error = std::make_pair(500, std::string("AUTH_RESTART"));
    try {
        client->invoke(std::make_shared<query_sign_in>("15551234567", "hash-15551234567", "12345"));
        FAIL("expected an rpc error");
    } catch (const tgc_dc_redirect_error&) {
        FAIL("not a redirect");
    } catch (const tgc_rpc_error& e) {
        REQUIRE(e.error_code() == 500);
        REQUIRE(e.error_string() == "AUTH_RESTART");
    }
}

TEST_CASE("reconnect_to_dc switches the session to the new data center", "[mtproto_client]") {
    fake_backend backend;
    auto client = backend.make_client();

    REQUIRE_THROWS_AS(client->reconnect_to_dc(4), tgc_usage_error);

    REQUIRE(client->connect());
    auto first_sender = backend.sender_factory->current();

    REQUIRE_THROWS_AS(client->reconnect_to_dc(9), tgc_usage_error);

    REQUIRE(client->reconnect_to_dc(4));
    REQUIRE(first_sender->disconnected);
    REQUIRE(backend.connection_factory->connections.front()->status() == tgc_connection_status::disconnected);
    REQUIRE(backend.connection_factory->opened_hosts().back() == dc_address(4));
    REQUIRE(client->session()->server_address == dc_address(4));
    REQUIRE(client->session()->port == 443);
    REQUIRE(backend.session_store->sessions["test-session"].server_address == dc_address(4));
    REQUIRE(backend.authenticator->negotiations == 2);
}

TEST_CASE("IPv6 data center options need IPv6 to be enabled", "[mtproto_client]") {
    fake_backend backend;
    backend.server->config.dc_options.push_back(tgc_dc_option(7, "2001:db8::7", 443, true));

    SECTION("disabled") {
        auto client = backend.make_client();
        REQUIRE(client->connect());
        REQUIRE_THROWS_AS(client->reconnect_to_dc(7), tgc_usage_error);
    }

    SECTION("enabled") {
        backend.config.ipv6_enabled = true;
        auto client = backend.make_client();
        REQUIRE(client->connect());
        REQUIRE(client->reconnect_to_dc(7));
        REQUIRE(client->session()->server_address == "2001:db8::7");
    }
}

TEST_CASE("invoke_with_redirects follows data center migrations", "[mtproto_client]") {
    fake_backend backend;

    SECTION("within the limit") {
        backend.server->send_code_redirects = { 4, 5 };
        auto client = backend.make_client();
        REQUIRE(client->connect());

        auto code = client->invoke_with_redirects(std::make_shared<query_send_code>("15551234567", 1, "hash"));
        REQUIRE(code.phone_code_hash == "hash-15551234567");
        REQUIRE(backend.connection_factory->opened_hosts()
                == (std::vector<std::string>{ TG_SERVER_2, dc_address(4), dc_address(5) }));
        REQUIRE(backend.server->queries.back() == "send code@" + dc_address(5));
    }

    SECTION("beyond the limit") {
        backend.config.max_dc_redirects = 2;
        backend.server->send_code_redirects = { 1, 2, 3 };
        auto client = backend.make_client();
        REQUIRE(client->connect());

        REQUIRE_THROWS_AS(client->invoke_with_redirects(std::make_shared<query_send_code>("15551234567", 1, "hash")),
                tgc_dc_redirect_error);
        REQUIRE(backend.connection_factory->opened_hosts().size() == 3);
    }

    SECTION("failed reconnection") {
        backend.server->send_code_redirects = { 3 };
        auto client = backend.make_client();
        REQUIRE(client->connect());
        backend.connection_factory->reachable = false;

        REQUIRE_THROWS_AS(client->invoke_with_redirects(std::make_shared<query_send_code>("15551234567", 1, "hash")),
                tgc_connection_error);
        REQUIRE_FALSE(client->is_connected());
    }
}

TEST_CASE("update callbacks survive sender rebuilds", "[mtproto_client]") {
    fake_backend backend;
    auto client = backend.make_client();
    auto callback = std::make_shared<recording_update_callback>();

    client->add_update_callback(callback);
    client->add_update_callback(callback);
    REQUIRE(client->connect());
    REQUIRE(backend.sender_factory->current()->callbacks.size() == 1);

    client->set_listen_for_updates(true);
    REQUIRE(client->reconnect_to_dc(3));
    auto sender = backend.sender_factory->current();
    REQUIRE(backend.sender_factory->senders.size() == 2);
    REQUIRE(sender->callbacks.size() == 1);
    REQUIRE(sender->callbacks.front() == callback);
    REQUIRE(sender->listening);

    client->remove_update_callback(callback);
    REQUIRE(sender->callbacks.empty());
    REQUIRE(client->update_callbacks().empty());
}
