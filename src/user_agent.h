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

#include "tgc/tgc_user_agent.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace tgc {
namespace impl {

class login_manager;
class mtproto_client;
class transfer_manager;

class user_agent: public tgc_user_agent
{
public:
    user_agent(const tgc_user_agent_config& config,
            const std::shared_ptr<mtproto_client>& client,
            const tgc_message_entity_parser& entity_parser);
    ~user_agent();

    // == tgc_user_agent ==
    virtual bool connect(bool force_reauthorization = false) override;
    virtual void disconnect() override;
    virtual bool is_connected() const override;

    virtual bool is_authorized() const override;
    virtual void send_code(const std::string& phone_number) override;
    virtual bool sign_in(const std::string& phone_number, const std::string& code) override;
    virtual bool log_out() override;
    virtual boost::optional<tgc_user> self() const override;

    virtual tgc_dialogs_result get_dialogs(int32_t limit = 10, int32_t offset_date = 0, int32_t offset_id = 0,
            const tgc_input_peer_t& offset_peer = tgc_input_peer_empty()) override;
    virtual tgc_sent_message send_message(const tgc_input_peer_t& peer, const std::string& text,
            bool markdown = false, bool no_webpage = false) override;
    virtual tgc_history_result get_history(const tgc_input_peer_t& peer, int32_t limit = 20,
            int32_t offset_date = 0, int32_t offset_id = 0, int32_t max_id = 0, int32_t min_id = 0,
            int32_t add_offset = 0) override;

    virtual tgc_sent_message send_photo_file(const tgc_input_file& file, const tgc_input_peer_t& peer,
            const std::string& caption = std::string()) override;
    virtual tgc_sent_message send_document_file(const tgc_input_file& file, const tgc_input_peer_t& peer,
            const std::string& caption = std::string()) override;
    virtual tgc_sent_message send_media_file(const tgc_input_media& media, const tgc_input_peer_t& peer) override;

    virtual void add_update_callback(const std::shared_ptr<tgc_update_callback>& callback) override;
    virtual void remove_update_callback(const std::shared_ptr<tgc_update_callback>& callback) override;

    virtual tgc_transfer_manager* transfer_manager() const override;
    virtual const tgc_user_agent_config& config() const override { return m_config; }

private:
    tgc_user_agent_config m_config;
    std::shared_ptr<mtproto_client> m_client;
    std::unique_ptr<login_manager> m_login_manager;
    std::unique_ptr<impl::transfer_manager> m_transfer_manager;
    tgc_message_entity_parser m_entity_parser;
};

}
}
