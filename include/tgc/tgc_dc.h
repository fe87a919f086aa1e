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
#ifndef __TGC_DC_H__
#define __TGC_DC_H__

#include <cstdint>
#include <string>

static constexpr const char* TG_SERVER_2 = "149.154.167.51";
static constexpr const char* TG_SERVER_TEST_1 = "149.154.175.40";

static constexpr int TG_SERVER_PORT = 443;

struct tgc_dc_option {
    int32_t id;
    std::string ip_address;
    int port;
    bool is_ipv6;

    tgc_dc_option(): id(0), port(0), is_ipv6(false) { }
    tgc_dc_option(int32_t id, const std::string& ip_address, int port, bool is_ipv6 = false)
        : id(id), ip_address(ip_address), port(port), is_ipv6(is_ipv6)
    { }
};

const char* tgc_default_server_address(bool test_mode);

#endif
