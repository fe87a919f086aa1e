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

#include "login_context.h"

#include "tgc/tgc_user.h"

#include <memory>
#include <string>

namespace tgc {
namespace impl {

class mtproto_client;

class login_manager
{
public:
    explicit login_manager(const std::shared_ptr<mtproto_client>& client);

    bool is_authorized() const;

    // Asks the server to send a login code to the phone.
    void send_code(const std::string& phone);

    // Returns false when the code was not accepted.
    bool sign_in(const std::string& phone, const std::string& code);

    bool log_out();

    const login_context& context() const { return m_context; }

private:
    std::shared_ptr<mtproto_client> m_client;
    login_context m_context;
};

}
}
