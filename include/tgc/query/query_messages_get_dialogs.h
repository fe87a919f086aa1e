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

#include "tgc/tgc_message.h"
#include "tgc/tgc_peer_id.h"
#include "tgc/tgc_query.h"

#include <cstdint>

namespace tgc {

class query_messages_get_dialogs: public query_with_result<tgc_messages_dialogs>
{
public:
    query_messages_get_dialogs(int32_t offset_date, int32_t offset_id,
            const tgc_input_peer_t& offset_peer, int32_t limit)
        : query_with_result<tgc_messages_dialogs>("get dialogs")
        , m_offset_date(offset_date)
        , m_offset_id(offset_id)
        , m_offset_peer(offset_peer)
        , m_limit(limit)
    { }

    int32_t offset_date() const { return m_offset_date; }
    int32_t offset_id() const { return m_offset_id; }
    const tgc_input_peer_t& offset_peer() const { return m_offset_peer; }
    int32_t limit() const { return m_limit; }

    virtual void accept(query_visitor& visitor) override { visitor.visit(*this); }

private:
    int32_t m_offset_date;
    int32_t m_offset_id;
    tgc_input_peer_t m_offset_peer;
    int32_t m_limit;
};

}
