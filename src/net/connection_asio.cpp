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

#include "tgc/tgc_net_asio.h"

#include "tgc/tgc_log.h"

#include <boost/lexical_cast.hpp>

#include <cstring>

tgc_connection_asio::tgc_connection_asio(boost::asio::io_service& io_service)
    : m_io_service(io_service)
    , m_socket(io_service)
    , m_port(0)
    , m_status(tgc_connection_status::disconnected)
    , m_stats()
{
}

tgc_connection_asio::~tgc_connection_asio()
{
    close();
}

bool tgc_connection_asio::open(const std::string& host, int port)
{
    close();

    m_host = host;
    m_port = port;
    m_status = tgc_connection_status::connecting;

    boost::system::error_code ec;
    boost::asio::ip::tcp::resolver resolver(m_io_service);
    boost::asio::ip::tcp::resolver::query query(host, boost::lexical_cast<std::string>(port),
            boost::asio::ip::resolver_query_base::numeric_service);
    auto endpoints = resolver.resolve(query, ec);
    if (ec) {
        TGC_ERROR("can not resolve " << host << ":" << port << ": " << ec.message());
        fail(ec);
        return false;
    }

    boost::asio::connect(m_socket, endpoints, ec);
    if (ec) {
        TGC_ERROR("can not connect to " << host << ":" << port << ": " << ec.message());
        fail(ec);
        return false;
    }

    m_socket.set_option(boost::asio::ip::tcp::no_delay(true), ec);
    if (ec) {
        TGC_WARNING("can not disable nagle for " << host << ":" << port << ": " << ec.message());
    }

    m_status = tgc_connection_status::connected;
    TGC_DEBUG("connected to " << host << ":" << port);
    return true;
}

void tgc_connection_asio::close()
{
    m_write_buffer.clear();

    if (!m_socket.is_open()) {
        m_status = tgc_connection_status::disconnected;
        return;
    }

    boost::system::error_code ec;
    m_socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::asio::error::not_connected) {
        TGC_DEBUG("shutdown of " << m_host << ":" << m_port << " failed: " << ec.message());
    }
    m_socket.close(ec);
    if (ec) {
        TGC_WARNING("close of " << m_host << ":" << m_port << " failed: " << ec.message());
    }
    m_status = tgc_connection_status::disconnected;
}

ssize_t tgc_connection_asio::write(const void* data, size_t len)
{
    if (m_status != tgc_connection_status::connected) {
        TGC_WARNING("write to " << m_host << ":" << m_port << " while " << m_status);
        return -1;
    }

    const char* bytes = static_cast<const char*>(data);
    m_write_buffer.insert(m_write_buffer.end(), bytes, bytes + len);
    return len;
}

void tgc_connection_asio::flush()
{
    if (m_write_buffer.empty() || m_status != tgc_connection_status::connected) {
        return;
    }

    boost::system::error_code ec;
    size_t written = boost::asio::write(m_socket, boost::asio::buffer(m_write_buffer), ec);
    m_stats.bytes_sent += written;
    m_write_buffer.clear();
    if (ec) {
        TGC_ERROR("write to " << m_host << ":" << m_port << " failed: " << ec.message());
        fail(ec);
    }
}

ssize_t tgc_connection_asio::read(void* data, size_t len)
{
    if (m_status != tgc_connection_status::connected) {
        TGC_WARNING("read from " << m_host << ":" << m_port << " while " << m_status);
        return -1;
    }

    boost::system::error_code ec;
    size_t read_bytes = boost::asio::read(m_socket, boost::asio::buffer(data, len), ec);
    m_stats.bytes_received += read_bytes;
    if (ec) {
        if (ec == boost::asio::error::eof) {
            TGC_NOTICE(m_host << ":" << m_port << " closed the connection");
        } else {
            TGC_ERROR("read from " << m_host << ":" << m_port << " failed: " << ec.message());
        }
        fail(ec);
        return read_bytes ? static_cast<ssize_t>(read_bytes) : -1;
    }

    return read_bytes;
}

void tgc_connection_asio::fail(const boost::system::error_code& error)
{
    TGC_DEBUG("closing " << m_host << ":" << m_port << " after " << error.message());
    close();
}
