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

#include <sys/types.h>

#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

enum class tgc_connection_status {
    disconnected,
    connecting,
    connected,
};

inline static std::string to_string(tgc_connection_status status)
{
    switch (status) {
    case tgc_connection_status::disconnected:
        return "disconnected";
    case tgc_connection_status::connecting:
        return "connecting";
    case tgc_connection_status::connected:
        return "connected";
    }

    assert(false);
    return "unknown connection status";
}

inline static std::ostream& operator<<(std::ostream& os, tgc_connection_status status)
{
    os << to_string(status);
    return os;
}

struct tgc_net_stats
{
    uint64_t bytes_sent;
    uint64_t bytes_received;
};

// A byte stream to one data center. Reads and writes block.
class tgc_connection {
public:
    virtual bool open(const std::string& host, int port) = 0;
    virtual void close() = 0;
    virtual ssize_t write(const void* data, size_t len) = 0;
    virtual ssize_t read(void* data, size_t len) = 0;
    virtual void flush() = 0;
    virtual tgc_connection_status status() const = 0;
    virtual const std::string& host() const = 0;
    virtual int port() const = 0;
    virtual tgc_net_stats stats() const = 0;

    virtual ~tgc_connection() { }
};

class tgc_connection_factory {
public:
    virtual std::shared_ptr<tgc_connection> create_connection() = 0;

    virtual ~tgc_connection_factory() { }
};
