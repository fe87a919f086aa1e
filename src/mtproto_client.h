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
#ifndef __MTPROTO_CLIENT_H__
#define __MTPROTO_CLIENT_H__

#include "tgc/tgc_dc.h"
#include "tgc/tgc_errors.h"
#include "tgc/tgc_log.h"
#include "tgc/tgc_query.h"
#include "tgc/tgc_session.h"
#include "tgc/tgc_user_agent.h"

#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

class tgc_authenticator;
class tgc_connection;
class tgc_connection_factory;
class tgc_sender;
class tgc_sender_factory;
class tgc_session_store;
class tgc_update_callback;

namespace tgc {
namespace impl {

// Owns the session, the connection to the current data center and the
// sender built on top of it.
class mtproto_client {
public:
    mtproto_client(const tgc_user_agent_config& config,
            const std::shared_ptr<tgc_session>& session,
            const std::shared_ptr<tgc_connection_factory>& connection_factory,
            const std::shared_ptr<tgc_authenticator>& authenticator,
            const std::shared_ptr<tgc_sender_factory>& sender_factory,
            const std::shared_ptr<tgc_session_store>& session_store);
    ~mtproto_client();

    mtproto_client(const mtproto_client&) = delete;
    mtproto_client& operator=(const mtproto_client&) = delete;

    // Negotiates an auth key when there is none or when forced, then sets up
    // the protocol layer. Failures are logged, never thrown.
    bool connect(bool force_reauthorization = false);

    // Throws tgc_usage_error when dc_id is not among the known options.
    bool reconnect_to_dc(int32_t dc_id);

    void disconnect();
    bool is_connected() const { return !!m_sender; }

    // Sends the query and blocks for its answer.
    template<typename Q>
    typename Q::result_type invoke(const std::shared_ptr<Q>& q)
    {
        static_assert(std::is_base_of<query, Q>::value, "only queries can be invoked");
        if (!q) {
            throw tgc_usage_error("can not invoke a null query");
        }
        execute(*q);
        return q->result();
    }

    // Like invoke but follows data center migrations, reconnecting each time.
    template<typename Q>
    typename Q::result_type invoke_with_redirects(const std::shared_ptr<Q>& q)
    {
        int32_t redirects = 0;
        while (true) {
            try {
                return invoke(q);
            } catch (const tgc_dc_redirect_error& e) {
                if (redirects >= m_config.max_dc_redirects) {
                    TGC_ERROR("query \"" << q->name() << "\" gave up after " << redirects << " redirects");
                    throw;
                }
                ++redirects;
                TGC_NOTICE("query \"" << q->name() << "\" redirected to DC " << e.new_dc());
                if (!reconnect_to_dc(e.new_dc())) {
                    throw tgc_connection_error("could not reconnect to DC " + std::to_string(e.new_dc()));
                }
                q->reset();
            }
        }
    }

    // Throws tgc_rpc_error or tgc_dc_redirect_error for errors recorded on
    // the query.
    void execute(query& q);

    const std::shared_ptr<tgc_session>& session() const { return m_session; }
    void save_session();

    const std::vector<tgc_dc_option>& dc_options() const { return m_dc_options; }
    const tgc_user_agent_config& config() const { return m_config; }

    void set_listen_for_updates(bool listen);
    bool is_listening_for_updates() const { return m_listen_for_updates; }

    void add_update_callback(const std::shared_ptr<tgc_update_callback>& callback);
    void remove_update_callback(const std::shared_ptr<tgc_update_callback>& callback);
    const std::vector<std::shared_ptr<tgc_update_callback>>& update_callbacks() const { return m_update_callbacks; }

private:
    bool open_connection();
    void close_connection();
    void create_sender();
    void drop_sender();
    void init_connection();
    const tgc_dc_option* find_dc_option(int32_t dc_id) const;

private:
    tgc_user_agent_config m_config;
    std::shared_ptr<tgc_session> m_session;
    std::shared_ptr<tgc_connection_factory> m_connection_factory;
    std::shared_ptr<tgc_authenticator> m_authenticator;
    std::shared_ptr<tgc_sender_factory> m_sender_factory;
    std::shared_ptr<tgc_session_store> m_session_store;

    std::shared_ptr<tgc_connection> m_connection;
    std::shared_ptr<tgc_sender> m_sender;
    std::vector<tgc_dc_option> m_dc_options;
    std::vector<std::shared_ptr<tgc_update_callback>> m_update_callbacks;
    bool m_listen_for_updates;
};

}
}

#endif
