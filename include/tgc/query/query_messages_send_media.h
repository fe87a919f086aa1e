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

#include "query_messages_send_message.h"
#include "tgc/tgc_message_media.h"
#include "tgc/tgc_peer_id.h"
#include "tgc/tgc_query.h"

#include <cstdint>

namespace tgc {

class query_messages_send_media: public query_with_result<tgc_sent_message>
{
public:
    query_messages_send_media(const tgc_input_peer_t& peer, const tgc_input_media& media, int64_t random_id)
        : query_with_result<tgc_sent_message>("send media")
        , m_peer(peer)
        , m_media(media)
        , m_random_id(random_id)
    { }

    const tgc_input_peer_t& peer() const { return m_peer; }
    const tgc_input_media& media() const { return m_media; }
    int64_t random_id() const { return m_random_id; }

    virtual void accept(query_visitor& visitor) override { visitor.visit(*this); }

private:
    tgc_input_peer_t m_peer;
    tgc_input_media m_media;
    int64_t m_random_id;
};

}
