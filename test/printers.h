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

#include "tgc/query/query_send_code.h"
#include "tgc/tgc_peer_id.h"
#include "tgc/tgc_user.h"

#include <boost/optional/optional_io.hpp>

#include <ostream>

// So that failed checks can show the values involved.

inline std::ostream& operator<<(std::ostream& os, const tgc_user& user)
{
    os << "user(" << user.id << ", " << user.first_name;
    if (user.last_name) {
        os << " " << *user.last_name;
    }
    return os << ")";
}

inline std::ostream& operator<<(std::ostream& os, const tgc_sent_code& code)
{
    return os << "sent_code(" << code.phone_code_hash << ", " << code.phone_registered << ")";
}
