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

#ifndef __TGC_USER_AGENT_H__
#define __TGC_USER_AGENT_H__

#include "tgc_message.h"
#include "tgc_message_entity.h"
#include "tgc_message_media.h"
#include "tgc_peer_id.h"
#include "tgc_user.h"

#include <boost/optional.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

class tgc_authenticator;
class tgc_connection_factory;
class tgc_sender_factory;
class tgc_session_store;
class tgc_transfer_manager;
class tgc_update_callback;

static constexpr int32_t TGC_DEFAULT_LAYER = 66;
static constexpr int32_t TGC_DEFAULT_MAX_DC_REDIRECTS = 5;

struct tgc_user_agent_config {
    std::string session_id;
    int32_t api_id;
    std::string api_hash;
    std::string app_version;
    std::string device_model;
    std::string system_version;
    std::string lang_code;
    int32_t layer;
    bool test_mode;
    bool ipv6_enabled;
    int32_t max_dc_redirects;
    int32_t default_part_size_kb;

    // The device model and system version are taken from uname.
    tgc_user_agent_config();

    // Throws tgc_configuration_error.
    void validate() const;
};

struct tgc_dialogs_result {
    std::vector<tgc_dialog> dialogs;
    // Parallel to dialogs.
    std::vector<boost::optional<std::string>> display_names;
    std::vector<boost::optional<tgc_input_peer_t>> input_peers;
};

struct tgc_history_result {
    int32_t total_count;
    std::vector<tgc_message> messages;
    // Parallel to messages.
    std::vector<boost::optional<tgc_user>> senders;

    tgc_history_result(): total_count(0) { }
};

class tgc_user_agent
{
public:
    static std::shared_ptr<tgc_user_agent> create(const tgc_user_agent_config& config,
            const std::shared_ptr<tgc_connection_factory>& connection_factory,
            const std::shared_ptr<tgc_authenticator>& authenticator,
            const std::shared_ptr<tgc_sender_factory>& sender_factory,
            const std::shared_ptr<tgc_session_store>& session_store,
            const tgc_message_entity_parser& entity_parser = nullptr);

    virtual ~tgc_user_agent() { }

    // Returns false when the data center could not be reached or set up.
    virtual bool connect(bool force_reauthorization = false) = 0;
    virtual void disconnect() = 0;
    virtual bool is_connected() const = 0;

    virtual bool is_authorized() const = 0;
    virtual void send_code(const std::string& phone_number) = 0;
    // False when the code was wrong or has expired.
    virtual bool sign_in(const std::string& phone_number, const std::string& code) = 0;
    virtual bool log_out() = 0;
    virtual boost::optional<tgc_user> self() const = 0;

    virtual tgc_dialogs_result get_dialogs(int32_t limit = 10, int32_t offset_date = 0, int32_t offset_id = 0,
            const tgc_input_peer_t& offset_peer = tgc_input_peer_empty()) = 0;
    virtual tgc_sent_message send_message(const tgc_input_peer_t& peer, const std::string& text,
            bool markdown = false, bool no_webpage = false) = 0;
    virtual tgc_history_result get_history(const tgc_input_peer_t& peer, int32_t limit = 20,
            int32_t offset_date = 0, int32_t offset_id = 0, int32_t max_id = 0, int32_t min_id = 0,
            int32_t add_offset = 0) = 0;

    virtual tgc_sent_message send_photo_file(const tgc_input_file& file, const tgc_input_peer_t& peer,
            const std::string& caption = std::string()) = 0;
    virtual tgc_sent_message send_document_file(const tgc_input_file& file, const tgc_input_peer_t& peer,
            const std::string& caption = std::string()) = 0;
    virtual tgc_sent_message send_media_file(const tgc_input_media& media, const tgc_input_peer_t& peer) = 0;

    virtual void add_update_callback(const std::shared_ptr<tgc_update_callback>& callback) = 0;
    virtual void remove_update_callback(const std::shared_ptr<tgc_update_callback>& callback) = 0;

    virtual tgc_transfer_manager* transfer_manager() const = 0;
    virtual const tgc_user_agent_config& config() const = 0;
};

#endif
