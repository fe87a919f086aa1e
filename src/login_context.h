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

#include <boost/optional.hpp>

#include <map>
#include <string>

namespace tgc {
namespace impl {

// Codes requested but not yet confirmed, by phone number.
struct login_context
{
    void add_sent_code(const std::string& phone, const tgc_sent_code& code)
    {
        sent_codes[phone] = code;
    }

    boost::optional<tgc_sent_code> sent_code(const std::string& phone) const
    {
        auto it = sent_codes.find(phone);
        if (it == sent_codes.end()) {
            return boost::none;
        }
        return it->second;
    }

    void remove_sent_code(const std::string& phone) { sent_codes.erase(phone); }
    void clear() { sent_codes.clear(); }

    std::map<std::string, tgc_sent_code> sent_codes;
};

}
}
