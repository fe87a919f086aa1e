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

#include "login_manager.h"

#include "mtproto_client.h"
#include "tgc/query/query_logout.h"
#include "tgc/query/query_send_code.h"
#include "tgc/query/query_sign_in.h"
#include "tgc/tgc_errors.h"
#include "tgc/tgc_log.h"

#include <boost/algorithm/string/predicate.hpp>

namespace tgc {
namespace impl {

login_manager::login_manager(const std::shared_ptr<mtproto_client>& client)
    : m_client(client)
{
}

bool login_manager::is_authorized() const
{
    return m_client->session()->is_logged_in();
}

void login_manager::send_code(const std::string& phone)
{
    const auto& config = m_client->config();
    auto q = std::make_shared<query_send_code>(phone, config.api_id, config.api_hash);
    tgc_sent_code code = m_client->invoke_with_redirects(q);

    TGC_NOTICE("login code sent to " << phone << (code.phone_registered ? "" : ", phone is not registered"));
    m_context.add_sent_code(phone, code);
}

bool login_manager::sign_in(const std::string& phone, const std::string& code)
{
    auto sent_code = m_context.sent_code(phone);
    if (!sent_code) {
        throw tgc_usage_error("no login code was requested for " + phone);
    }

    tgc_authorization authorization;
    try {
        auto q = std::make_shared<query_sign_in>(phone, sent_code->phone_code_hash, code);
        authorization = m_client->invoke(q);
    } catch (const tgc_rpc_error& e) {
        if (boost::starts_with(e.error_string(), "PHONE_CODE_")) {
            TGC_WARNING("sign in for " << phone << " failed: " << e.error_string());
            return false;
        }
        throw;
    }

    auto session = m_client->session();
    session->user = authorization.user;
    m_client->save_session();
    m_context.remove_sent_code(phone);
    m_client->set_listen_for_updates(true);

    TGC_NOTICE("signed in as user " << authorization.user.id);
    return true;
}

bool login_manager::log_out()
{
    bool success = m_client->invoke(std::make_shared<query_logout>());
    if (!success) {
        TGC_WARNING("the server refused to log out");
        return false;
    }

    m_client->set_listen_for_updates(false);
    auto session = m_client->session();
    session->user = boost::none;
    m_client->save_session();
    m_context.clear();

    TGC_NOTICE("logged out");
    return true;
}

}
}
