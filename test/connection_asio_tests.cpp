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

#include "tgc/tgc_net_asio.h"

#include <boost/asio.hpp>

#include <thread>

TEST_CASE("asio connections exchange bytes", "[connection_asio]") {
    boost::asio::io_service io_service;
    boost::asio::ip::tcp::acceptor acceptor(io_service,
            boost::asio::ip::tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
    int port = acceptor.local_endpoint().port();

    // Echoes the first eight bytes back, then hangs up.
    std::thread server([&acceptor] {
        boost::asio::ip::tcp::socket peer(acceptor.get_executor());
        boost::system::error_code ec;
        acceptor.accept(peer, ec);
        if (ec) {
            return;
        }
        char buffer[8];
        boost::asio::read(peer, boost::asio::buffer(buffer), ec);
        if (!ec) {
            boost::asio::write(peer, boost::asio::buffer(buffer), ec);
        }
        peer.close(ec);
    });

    tgc_connection_factory_asio factory(io_service);
    auto connection = factory.create_connection();
    REQUIRE(connection->status() == tgc_connection_status::disconnected);
    REQUIRE(connection->open("127.0.0.1", port));
    REQUIRE(connection->status() == tgc_connection_status::connected);
    REQUIRE(connection->host() == "127.0.0.1");
    REQUIRE(connection->port() == port);

    REQUIRE(connection->write("abcd", 4) == 4);
    REQUIRE(connection->write("efgh", 4) == 4);
    REQUIRE(connection->stats().bytes_sent == 0);
    connection->flush();
    REQUIRE(connection->stats().bytes_sent == 8);

    char echoed[8];
    REQUIRE(connection->read(echoed, sizeof(echoed)) == 8);
    REQUIRE(std::string(echoed, sizeof(echoed)) == "abcdefgh");
    REQUIRE(connection->stats().bytes_received == 8);

    char more[1];
    REQUIRE(connection->read(more, sizeof(more)) == -1);
    REQUIRE(connection->status() == tgc_connection_status::disconnected);

    server.join();
}

TEST_CASE("asio connections report failures", "[connection_asio]") {
    boost::asio::io_service io_service;
    tgc_connection_asio connection(io_service);

    SECTION("io before open") {
        char byte = 0;
        REQUIRE(connection.write(&byte, 1) == -1);
        REQUIRE(connection.read(&byte, 1) == -1);
    }

    SECTION("nobody listening") {
        boost::asio::ip::tcp::acceptor acceptor(io_service,
                boost::asio::ip::tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
        int port = acceptor.local_endpoint().port();
        acceptor.close();

        REQUIRE_FALSE(connection.open("127.0.0.1", port));
        REQUIRE(connection.status() == tgc_connection_status::disconnected);
    }
}
