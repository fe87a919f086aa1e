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
#include "tgc/tgc_user.h"

#include <string>

// auth.Authorization
struct tgc_authorization {
    tgc_user user;
};

namespace tgc {

class query_sign_in: public query_with_result<tgc_authorization>
{
public:
    query_sign_in(const std::string& phone_number, const std::string& phone_code_hash, const std::string& phone_code)
        : query_with_result<tgc_authorization>("sign in")
        , m_phone_number(phone_number)
        , m_phone_code_hash(phone_code_hash)
        , m_phone_code(phone_code)
    { }

    const std::string& phone_number() const { return m_phone_number; }
    const std::string& phone_code_hash() const { return m_phone_code_hash; }
    const std::string& phone_code() const { return m_phone_code; }

    virtual void accept(query_visitor& visitor) override { visitor.visit(*this); }

private:
    std::string m_phone_number;
    std::string m_phone_code_hash;
    std::string m_phone_code;
};

}
