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

#include "user_agent.h"

#include "crypto/crypto_rand.h"
#include "login_manager.h"
#include "mtproto_client.h"
#include "tgc/query/query_messages_get_dialogs.h"
#include "tgc/query/query_messages_get_history.h"
#include "tgc/query/query_messages_send_media.h"
#include "tgc/query/query_messages_send_message.h"
#include "tgc/tgc_authenticator.h"
#include "tgc/tgc_errors.h"
#include "tgc/tgc_log.h"
#include "tgc/tgc_mime_type.h"
#include "tgc/tgc_net.h"
#include "tgc/tgc_peer_resolver.h"
#include "tgc/tgc_sender.h"
#include "tgc/tgc_session_store.h"
#include "tgc/tgc_update_callback.h"
#include "tools.h"
#include "transfer_manager.h"

tgc_user_agent_config::tgc_user_agent_config()
    : api_id(0)
    , app_version("1.0")
    , device_model(tgc_device_model())
    , system_version(tgc_system_version())
    , lang_code("en")
    , layer(TGC_DEFAULT_LAYER)
    , test_mode(false)
    , ipv6_enabled(false)
    , max_dc_redirects(TGC_DEFAULT_MAX_DC_REDIRECTS)
    , default_part_size_kb(TGC_DEFAULT_PART_SIZE_KB)
{
}

void tgc_user_agent_config::validate() const
{
    if (api_id == 0 || api_hash.empty()) {
        throw tgc_configuration_error("an api id and an api hash are required");
    }
    if (session_id.empty()) {
        throw tgc_configuration_error("a session id is required");
    }
    if (layer <= 0) {
        throw tgc_configuration_error("invalid layer " + std::to_string(layer));
    }
    if (default_part_size_kb <= 0) {
        throw tgc_configuration_error("invalid default part size " + std::to_string(default_part_size_kb) + " KB");
    }
    if (max_dc_redirects < 0) {
        throw tgc_configuration_error("max_dc_redirects can not be negative");
    }
}

std::shared_ptr<tgc_user_agent> tgc_user_agent::create(const tgc_user_agent_config& config,
        const std::shared_ptr<tgc_connection_factory>& connection_factory,
        const std::shared_ptr<tgc_authenticator>& authenticator,
        const std::shared_ptr<tgc_sender_factory>& sender_factory,
        const std::shared_ptr<tgc_session_store>& session_store,
        const tgc_message_entity_parser& entity_parser)
{
    config.validate();
    if (!connection_factory || !authenticator || !sender_factory || !session_store) {
        throw tgc_configuration_error("the connection factory, authenticator, sender factory and session store are required");
    }

    auto session = session_store->load(config.session_id, config.test_mode);
    if (!session) {
        throw tgc_configuration_error("the session store returned no session for " + config.session_id);
    }

    auto client = std::make_shared<tgc::impl::mtproto_client>(config, session,
            connection_factory, authenticator, sender_factory, session_store);
    return std::make_shared<tgc::impl::user_agent>(config, client, entity_parser);
}

namespace tgc {
namespace impl {

user_agent::user_agent(const tgc_user_agent_config& config,
        const std::shared_ptr<mtproto_client>& client,
        const tgc_message_entity_parser& entity_parser)
    : m_config(config)
    , m_client(client)
    , m_login_manager(new login_manager(client))
    , m_transfer_manager(new impl::transfer_manager(client, config.default_part_size_kb))
    , m_entity_parser(entity_parser)
{
}

user_agent::~user_agent()
{
}

bool user_agent::connect(bool force_reauthorization)
{
    return m_client->connect(force_reauthorization);
}

void user_agent::disconnect()
{
    m_client->disconnect();
}

bool user_agent::is_connected() const
{
    return m_client->is_connected();
}

bool user_agent::is_authorized() const
{
    return m_login_manager->is_authorized();
}

void user_agent::send_code(const std::string& phone_number)
{
    m_login_manager->send_code(phone_number);
}

bool user_agent::sign_in(const std::string& phone_number, const std::string& code)
{
    if (!m_login_manager->sign_in(phone_number, code)) {
        return false;
    }

    const tgc_user& user = *m_client->session()->user;
    for (const auto& callback: m_client->update_callbacks()) {
        callback->logged_in(user);
    }
    return true;
}

bool user_agent::log_out()
{
    if (!m_login_manager->log_out()) {
        return false;
    }

    for (const auto& callback: m_client->update_callbacks()) {
        callback->logged_out();
    }
    return true;
}

boost::optional<tgc_user> user_agent::self() const
{
    return m_client->session()->user;
}

tgc_dialogs_result user_agent::get_dialogs(int32_t limit, int32_t offset_date, int32_t offset_id,
        const tgc_input_peer_t& offset_peer)
{
    auto q = std::make_shared<query_messages_get_dialogs>(offset_date, offset_id, offset_peer, limit);
    tgc_messages_dialogs answer = m_client->invoke(q);

    tgc_dialogs_result result;
    result.dialogs = answer.dialogs;
    for (const auto& dialog: answer.dialogs) {
        result.display_names.push_back(tgc_find_display_name(dialog.peer, answer.users, answer.chats));
        result.input_peers.push_back(tgc_find_input_peer(dialog.peer, answer.users, answer.chats));
        if (!result.input_peers.back()) {
            TGC_WARNING("dialog with " << dialog.peer << " has no matching user or chat");
        }
    }

    TGC_DEBUG("got " << result.dialogs.size() << " dialogs");
    return result;
}

tgc_sent_message user_agent::send_message(const tgc_input_peer_t& peer, const std::string& text,
        bool markdown, bool no_webpage)
{
    if (tgc_is_empty(peer)) {
        throw tgc_usage_error("can not send a message to an empty peer");
    }

    std::string message = text;
    std::vector<tgc_message_entity> entities;
    if (markdown) {
        if (!m_entity_parser) {
            throw tgc_usage_error("markdown was requested but no message entity parser was given");
        }
        auto parsed = m_entity_parser(text);
        message = parsed.first;
        entities = parsed.second;
    }

    TGC_DEBUG("sending message to " << peer);
    auto q = std::make_shared<query_messages_send_message>(peer, message,
            tgc_secure_random<int64_t>(), entities, no_webpage);
    return m_client->invoke(q);
}

tgc_history_result user_agent::get_history(const tgc_input_peer_t& peer, int32_t limit,
        int32_t offset_date, int32_t offset_id, int32_t max_id, int32_t min_id, int32_t add_offset)
{
    auto q = std::make_shared<query_messages_get_history>(peer, offset_id, offset_date,
            add_offset, limit, max_id, min_id);
    tgc_messages_messages answer = m_client->invoke(q);

    tgc_history_result result;
    result.total_count = answer.count ? *answer.count : static_cast<int32_t>(answer.messages.size());
    result.messages = answer.messages;
    for (const auto& message: answer.messages) {
        boost::optional<tgc_user> sender;
        for (const auto& user: answer.users) {
            if (user.id == message.from_id) {
                sender = user;
                break;
            }
        }
        result.senders.push_back(sender);
    }

    TGC_DEBUG("got " << result.messages.size() << " of " << result.total_count << " messages with " << peer);
    return result;
}

tgc_sent_message user_agent::send_photo_file(const tgc_input_file& file, const tgc_input_peer_t& peer,
        const std::string& caption)
{
    tgc_input_media_uploaded_photo media;
    media.file = file;
    media.caption = caption;
    return send_media_file(media, peer);
}

tgc_sent_message user_agent::send_document_file(const tgc_input_file& file, const tgc_input_peer_t& peer,
        const std::string& caption)
{
    tgc_input_media_uploaded_document media;
    media.file = file;
    media.mime_type = tgc_mime_type_by_filename(file.name);
    media.attributes.push_back(tgc_document_attribute_filename(file.name));
    media.caption = caption;
    return send_media_file(media, peer);
}

tgc_sent_message user_agent::send_media_file(const tgc_input_media& media, const tgc_input_peer_t& peer)
{
    if (tgc_is_empty(peer)) {
        throw tgc_usage_error("can not send media to an empty peer");
    }
    TGC_DEBUG("sending media to " << peer);
    auto q = std::make_shared<query_messages_send_media>(peer, media, tgc_secure_random<int64_t>());
    return m_client->invoke(q);
}

void user_agent::add_update_callback(const std::shared_ptr<tgc_update_callback>& callback)
{
    m_client->add_update_callback(callback);
}

void user_agent::remove_update_callback(const std::shared_ptr<tgc_update_callback>& callback)
{
    m_client->remove_update_callback(callback);
}

tgc_transfer_manager* user_agent::transfer_manager() const
{
    return m_transfer_manager.get();
}

}
}
