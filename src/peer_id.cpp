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

    Copyright Topology LP 2017
*/

#include "tgc/tgc_peer_id.h"

#include <iostream>

namespace tgc {
namespace impl {

struct peer_type_visitor: public boost::static_visitor<tgc_peer_type>
{
    tgc_peer_type operator()(const tgc_peer_user&) const { return tgc_peer_type::user; }
    tgc_peer_type operator()(const tgc_peer_chat&) const { return tgc_peer_type::chat; }
    tgc_peer_type operator()(const tgc_peer_channel&) const { return tgc_peer_type::channel; }
    tgc_peer_type operator()(const tgc_input_peer_empty&) const { return tgc_peer_type::unknown; }
    tgc_peer_type operator()(const tgc_input_peer_user&) const { return tgc_peer_type::user; }
    tgc_peer_type operator()(const tgc_input_peer_chat&) const { return tgc_peer_type::chat; }
    tgc_peer_type operator()(const tgc_input_peer_channel&) const { return tgc_peer_type::channel; }
};

struct peer_id_visitor: public boost::static_visitor<int32_t>
{
    int32_t operator()(const tgc_peer_user& peer) const { return peer.user_id; }
    int32_t operator()(const tgc_peer_chat& peer) const { return peer.chat_id; }
    int32_t operator()(const tgc_peer_channel& peer) const { return peer.channel_id; }
};

struct input_peer_printer: public boost::static_visitor<void>
{
    explicit input_peer_printer(std::ostream& os): m_os(os) { }

    void operator()(const tgc_input_peer_empty&) const { m_os << "input_peer_empty"; }

    void operator()(const tgc_input_peer_user& peer) const
    {
        m_os << "input_peer_user(" << peer.user_id << ", " << peer.access_hash << ")";
    }

    void operator()(const tgc_input_peer_chat& peer) const
    {
        m_os << "input_peer_chat(" << peer.chat_id << ")";
    }

    void operator()(const tgc_input_peer_channel& peer) const
    {
        m_os << "input_peer_channel(" << peer.channel_id << ", " << peer.access_hash << ")";
    }

private:
    std::ostream& m_os;
};

static const char* peer_type_name(tgc_peer_type type)
{
    switch (type) {
    case tgc_peer_type::user:
        return "user";
    case tgc_peer_type::chat:
        return "chat";
    case tgc_peer_type::channel:
        return "channel";
    case tgc_peer_type::unknown:
        break;
    }
    return "unknown";
}

}
}

tgc_peer_type tgc_peer_type_of(const tgc_peer_t& peer)
{
    return boost::apply_visitor(tgc::impl::peer_type_visitor(), peer);
}

int32_t tgc_peer_id_of(const tgc_peer_t& peer)
{
    return boost::apply_visitor(tgc::impl::peer_id_visitor(), peer);
}

tgc_peer_type tgc_peer_type_of(const tgc_input_peer_t& peer)
{
    return boost::apply_visitor(tgc::impl::peer_type_visitor(), peer);
}

bool tgc_is_empty(const tgc_input_peer_t& peer)
{
    return tgc_peer_type_of(peer) == tgc_peer_type::unknown;
}

std::ostream& operator<<(std::ostream& os, const tgc_peer_t& peer)
{
    os << "peer_" << tgc::impl::peer_type_name(tgc_peer_type_of(peer)) << "(" << tgc_peer_id_of(peer) << ")";
    return os;
}

std::ostream& operator<<(std::ostream& os, const tgc_input_peer_t& peer)
{
    boost::apply_visitor(tgc::impl::input_peer_printer(os), peer);
    return os;
}
