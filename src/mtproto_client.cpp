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

#include "mtproto_client.h"

#include "tgc/query/query_help_get_config.h"
#include "tgc/query/query_init_connection.h"
#include "tgc/query/query_invoke_with_layer.h"
#include "tgc/tgc_authenticator.h"
#include "tgc/tgc_net.h"
#include "tgc/tgc_sender.h"
#include "tgc/tgc_session_store.h"
#include "tgc/tgc_update_callback.h"

#include <algorithm>

namespace tgc {
namespace impl {

mtproto_client::mtproto_client(const tgc_user_agent_config& config,
        const std::shared_ptr<tgc_session>& session,
        const std::shared_ptr<tgc_connection_factory>& connection_factory,
        const std::shared_ptr<tgc_authenticator>& authenticator,
        const std::shared_ptr<tgc_sender_factory>& sender_factory,
        const std::shared_ptr<tgc_session_store>& session_store)
    : m_config(config)
    , m_session(session)
    , m_connection_factory(connection_factory)
    , m_authenticator(authenticator)
    , m_sender_factory(sender_factory)
    , m_session_store(session_store)
    , m_listen_for_updates(false)
{
    if (!m_session || !m_connection_factory || !m_authenticator || !m_sender_factory || !m_session_store) {
        throw tgc_configuration_error("mtproto client is missing a collaborator");
    }
}

mtproto_client::~mtproto_client()
{
    disconnect();
}

bool mtproto_client::connect(bool force_reauthorization)
{
    try {
        if (!m_connection || m_connection->status() != tgc_connection_status::connected) {
            if (!open_connection()) {
                return false;
            }
        }

        if (force_reauthorization || !m_session->has_auth_key()) {
            TGC_NOTICE("negotiating auth key with " << m_session->server_address << ":" << m_session->port);
            tgc_auth_key_result result = m_authenticator->negotiate(*m_connection);
            m_session->auth_key = result.auth_key;
            m_session->time_offset = result.time_offset;
            save_session();
        }

        create_sender();
        init_connection();
    } catch (const tgc_rpc_error& e) {
        TGC_ERROR("failed to initialize connection: " << e.what());
        drop_sender();
        return false;
    } catch (const std::runtime_error& e) {
        TGC_ERROR("failed to connect to " << m_session->server_address << ":" << m_session->port << ": " << e.what());
        drop_sender();
        return false;
    }

    TGC_NOTICE("connected to " << m_session->server_address << ":" << m_session->port
            << " with " << m_dc_options.size() << " DC options");
    return true;
}

bool mtproto_client::reconnect_to_dc(int32_t dc_id)
{
    if (m_dc_options.empty()) {
        throw tgc_usage_error("can not reconnect to DC " + std::to_string(dc_id) + " before connecting");
    }

    const tgc_dc_option* option = find_dc_option(dc_id);
    if (!option) {
        throw tgc_usage_error("unknown DC " + std::to_string(dc_id));
    }

    // The options are refreshed by connect.
    std::string address = option->ip_address;
    int port = option->port;

    TGC_NOTICE("reconnecting to DC " << dc_id << " at " << address << ":" << port);
    disconnect();

    m_session->server_address = address;
    m_session->port = port;
    save_session();

    return connect(true);
}

void mtproto_client::disconnect()
{
    drop_sender();
    close_connection();
}

void mtproto_client::execute(query& q)
{
    if (!m_sender) {
        throw tgc_usage_error("not connected, can not invoke \"" + q.name() + "\"");
    }
    if (!m_session->has_auth_key()) {
        throw tgc_usage_error("no auth key, can not invoke \"" + q.name() + "\"");
    }

    TGC_DEBUG("sending query \"" << q.name() << "\"");
    m_sender->send(q);
    m_sender->receive(q);

    query& holder = q.answer_holder();
    if (holder.has_error()) {
        int32_t new_dc = tgc_dc_from_migration_error(holder.error_code(), holder.error_string());
        if (new_dc > 0) {
            throw tgc_dc_redirect_error(holder.error_code(), holder.error_string(), new_dc);
        }
        throw tgc_rpc_error(holder.error_code(), holder.error_string());
    }

    if (!holder.is_answered()) {
        throw std::runtime_error("no answer received for query \"" + q.name() + "\"");
    }
}

void mtproto_client::save_session()
{
    m_session_store->save(*m_session);
}

void mtproto_client::set_listen_for_updates(bool listen)
{
    m_listen_for_updates = listen;
    if (m_sender) {
        m_sender->set_listen_for_updates(listen);
    }
}

void mtproto_client::add_update_callback(const std::shared_ptr<tgc_update_callback>& callback)
{
    if (!callback) {
        return;
    }
    if (std::find(m_update_callbacks.begin(), m_update_callbacks.end(), callback) != m_update_callbacks.end()) {
        return;
    }
    m_update_callbacks.push_back(callback);
    if (m_sender) {
        m_sender->add_update_callback(callback);
    }
}

void mtproto_client::remove_update_callback(const std::shared_ptr<tgc_update_callback>& callback)
{
    auto it = std::find(m_update_callbacks.begin(), m_update_callbacks.end(), callback);
    if (it == m_update_callbacks.end()) {
        return;
    }
    m_update_callbacks.erase(it);
    if (m_sender) {
        m_sender->remove_update_callback(callback);
    }
}

bool mtproto_client::open_connection()
{
    close_connection();

    m_connection = m_connection_factory->create_connection();
    if (!m_connection) {
        TGC_ERROR("the connection factory did not create a connection");
        return false;
    }

    if (!m_connection->open(m_session->server_address, m_session->port)) {
        TGC_ERROR("could not open connection to " << m_session->server_address << ":" << m_session->port);
        m_connection.reset();
        return false;
    }

    TGC_DEBUG("connection to " << m_connection->host() << ":" << m_connection->port() << " is " << m_connection->status());
    return true;
}

void mtproto_client::close_connection()
{
    if (m_connection) {
        m_connection->close();
        m_connection.reset();
    }
}

void mtproto_client::create_sender()
{
    drop_sender();

    auto sender = m_sender_factory->create_sender(m_connection, m_session);
    if (!sender) {
        throw std::runtime_error("the sender factory did not create a sender");
    }

    for (const auto& callback: m_update_callbacks) {
        sender->add_update_callback(callback);
    }

    if (m_session->is_logged_in()) {
        m_listen_for_updates = true;
    }
    sender->set_listen_for_updates(m_listen_for_updates);

    m_sender = sender;
}

void mtproto_client::drop_sender()
{
    if (m_sender) {
        m_sender->disconnect();
        m_sender.reset();
    }
}

void mtproto_client::init_connection()
{
    auto get_config = std::make_shared<query_help_get_config>();
    auto q = std::make_shared<query_invoke_with_layer>(m_config.layer,
            std::make_shared<query_init_connection>(m_config.api_id,
                    m_config.device_model, m_config.system_version,
                    m_config.app_version, m_config.lang_code, get_config));
    execute(*q);

    m_dc_options = get_config->result().dc_options;
}

const tgc_dc_option* mtproto_client::find_dc_option(int32_t dc_id) const
{
    for (const auto& option: m_dc_options) {
        if (option.id != dc_id) {
            continue;
        }
        if (option.is_ipv6 && !m_config.ipv6_enabled) {
            continue;
        }
        return &option;
    }
    return nullptr;
}

}
}
