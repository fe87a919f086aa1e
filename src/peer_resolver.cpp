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

#include "tgc/tgc_peer_resolver.h"

namespace tgc {
namespace impl {

static const tgc_user* find_user(int32_t id, const std::vector<tgc_user>& users)
{
    for (const auto& user: users) {
        if (user.id == id) {
            return &user;
        }
    }
    return nullptr;
}

static const tgc_chat* find_chat(int32_t id, const std::vector<tgc_chat>& chats)
{
    for (const auto& chat: chats) {
        if (chat.id == id) {
            return &chat;
        }
    }
    return nullptr;
}

class display_name_resolver: public boost::static_visitor<boost::optional<std::string>>
{
public:
    display_name_resolver(const std::vector<tgc_user>& users, const std::vector<tgc_chat>& chats)
        : m_users(users)
        , m_chats(chats)
    { }

    boost::optional<std::string> operator()(const tgc_peer_user& peer) const
    {
        const tgc_user* user = find_user(peer.user_id, m_users);
        if (!user) {
            return boost::none;
        }
        if (user->last_name) {
            return user->first_name + " " + *user->last_name;
        }
        return user->first_name;
    }

    boost::optional<std::string> operator()(const tgc_peer_chat& peer) const
    {
        return title_of(peer.chat_id);
    }

    boost::optional<std::string> operator()(const tgc_peer_channel& peer) const
    {
        return title_of(peer.channel_id);
    }

private:
    boost::optional<std::string> title_of(int32_t id) const
    {
        const tgc_chat* chat = find_chat(id, m_chats);
        if (!chat) {
            return boost::none;
        }
        return chat->title;
    }

    const std::vector<tgc_user>& m_users;
    const std::vector<tgc_chat>& m_chats;
};

class input_peer_resolver: public boost::static_visitor<boost::optional<tgc_input_peer_t>>
{
public:
    input_peer_resolver(const std::vector<tgc_user>& users, const std::vector<tgc_chat>& chats)
        : m_users(users)
        , m_chats(chats)
    { }

    boost::optional<tgc_input_peer_t> operator()(const tgc_peer_user& peer) const
    {
        const tgc_user* user = find_user(peer.user_id, m_users);
        if (!user) {
            return boost::none;
        }
        return tgc_input_peer_t(tgc_input_peer_user(user->id, user->access_hash));
    }

    boost::optional<tgc_input_peer_t> operator()(const tgc_peer_chat& peer) const
    {
        const tgc_chat* chat = find_chat(peer.chat_id, m_chats);
        if (!chat) {
            return boost::none;
        }
        return tgc_input_peer_t(tgc_input_peer_chat(chat->id));
    }

    boost::optional<tgc_input_peer_t> operator()(const tgc_peer_channel& peer) const
    {
        const tgc_chat* chat = find_chat(peer.channel_id, m_chats);
        if (!chat) {
            return boost::none;
        }
        return tgc_input_peer_t(tgc_input_peer_channel(chat->id, chat->access_hash));
    }

private:
    const std::vector<tgc_user>& m_users;
    const std::vector<tgc_chat>& m_chats;
};

}
}

boost::optional<std::string> tgc_find_display_name(const tgc_peer_t& peer,
        const std::vector<tgc_user>& users, const std::vector<tgc_chat>& chats)
{
    return boost::apply_visitor(tgc::impl::display_name_resolver(users, chats), peer);
}

boost::optional<tgc_input_peer_t> tgc_find_input_peer(const tgc_peer_t& peer,
        const std::vector<tgc_user>& users, const std::vector<tgc_chat>& chats)
{
    return boost::apply_visitor(tgc::impl::input_peer_resolver(users, chats), peer);
}
