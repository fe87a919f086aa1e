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

#ifndef __TGC_NET_ASIO_H__
#define __TGC_NET_ASIO_H__

#include "tgc_net.h"

#include <boost/asio.hpp>

#include <memory>
#include <string>
#include <vector>

// A TCP connection with blocking reads. Writes are buffered until flush.
class tgc_connection_asio: public tgc_connection
{
public:
    explicit tgc_connection_asio(boost::asio::io_service& io_service);
    virtual ~tgc_connection_asio();

    virtual bool open(const std::string& host, int port) override;
    virtual void close() override;
    virtual ssize_t write(const void* data, size_t len) override;
    virtual ssize_t read(void* data, size_t len) override;
    virtual void flush() override;
    virtual tgc_connection_status status() const override { return m_status; }
    virtual const std::string& host() const override { return m_host; }
    virtual int port() const override { return m_port; }
    virtual tgc_net_stats stats() const override { return m_stats; }

private:
    void fail(const boost::system::error_code& error);

    boost::asio::io_service& m_io_service;
    boost::asio::ip::tcp::socket m_socket;
    std::string m_host;
    int m_port;
    tgc_connection_status m_status;
    std::vector<char> m_write_buffer;
    tgc_net_stats m_stats;
};

class tgc_connection_factory_asio: public tgc_connection_factory
{
public:
    explicit tgc_connection_factory_asio(boost::asio::io_service& io_service)
        : m_io_service(io_service)
    { }

    virtual std::shared_ptr<tgc_connection> create_connection() override
    {
        return std::make_shared<tgc_connection_asio>(m_io_service);
    }

private:
    boost::asio::io_service& m_io_service;
};

#endif
