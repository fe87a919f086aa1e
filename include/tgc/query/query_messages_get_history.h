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

class query_messages_get_history: public query_with_result<tgc_messages_messages>
{
public:
    query_messages_get_history(const tgc_input_peer_t& peer, int32_t offset_id, int32_t offset_date,
            int32_t add_offset, int32_t limit, int32_t max_id, int32_t min_id)
        : query_with_result<tgc_messages_messages>("get history")
        , m_peer(peer)
        , m_offset_id(offset_id)
        , m_offset_date(offset_date)
        , m_add_offset(add_offset)
        , m_limit(limit)
        , m_max_id(max_id)
        , m_min_id(min_id)
    { }

    const tgc_input_peer_t& peer() const { return m_peer; }
    int32_t offset_id() const { return m_offset_id; }
    int32_t offset_date() const { return m_offset_date; }
    int32_t add_offset() const { return m_add_offset; }
    int32_t limit() const { return m_limit; }
    int32_t max_id() const { return m_max_id; }
    int32_t min_id() const { return m_min_id; }

    virtual void accept(query_visitor& visitor) override { visitor.visit(*this); }

private:
    tgc_input_peer_t m_peer;
    int32_t m_offset_id;
    int32_t m_offset_date;
    int32_t m_add_offset;
    int32_t m_limit;
    int32_t m_max_id;
    int32_t m_min_id;
};

}
