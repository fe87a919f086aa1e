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

#include "tgc/tgc_query.h"

#include <cstdint>
#include <string>

// auth.SentCode
struct tgc_sent_code {
    bool phone_registered;
    std::string phone_code_hash;

    tgc_sent_code(): phone_registered(false) { }
    tgc_sent_code(bool phone_registered, const std::string& phone_code_hash)
        : phone_registered(phone_registered)
        , phone_code_hash(phone_code_hash)
    { }
};

namespace tgc {

class query_send_code: public query_with_result<tgc_sent_code>
{
public:
    query_send_code(const std::string& phone_number, int32_t api_id, const std::string& api_hash)
        : query_with_result<tgc_sent_code>("send code")
        , m_phone_number(phone_number)
        , m_api_id(api_id)
        , m_api_hash(api_hash)
    { }

    const std::string& phone_number() const { return m_phone_number; }
    int32_t api_id() const { return m_api_id; }
    const std::string& api_hash() const { return m_api_hash; }

    virtual void accept(query_visitor& visitor) override { visitor.visit(*this); }

private:
    std::string m_phone_number;
    int32_t m_api_id;
    std::string m_api_hash;
};

}
