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

#ifndef __TGC_SESSION_H__
#define __TGC_SESSION_H__

#include "tgc_user.h"

#include <boost/optional.hpp>

#include <array>
#include <memory>
#include <string>

using tgc_auth_key = std::array<unsigned char, 256>;

struct tgc_session {
    std::string session_id;
    boost::optional<tgc_auth_key> auth_key;
    double time_offset;
    std::string server_address;
    int port;
    boost::optional<tgc_user> user;

    tgc_session()
        : time_offset(0)
        , port(0)
    { }

    bool has_auth_key() const { return !!auth_key; }
    bool is_logged_in() const { return !!user; }

    // A session that has never connected: no key, pointed at the default DC.
    static std::shared_ptr<tgc_session> create(const std::string& session_id, bool test_mode = false);
};

#endif
