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

#include "tgc/tgc_query.h"

#include <cstdint>
#include <utility>
#include <vector>

namespace tgc {

class query_upload_save_file_part: public query_with_result<bool>
{
public:
    query_upload_save_file_part(int64_t file_id, int32_t part, std::vector<char> bytes)
        : query_with_result<bool>("upload file part")
        , m_file_id(file_id)
        , m_part(part)
        , m_bytes(std::move(bytes))
    { }

    int64_t file_id() const { return m_file_id; }
    int32_t part() const { return m_part; }
    const std::vector<char>& bytes() const { return m_bytes; }

    virtual void accept(query_visitor& visitor) override { visitor.visit(*this); }

private:
    int64_t m_file_id;
    int32_t m_part;
    std::vector<char> m_bytes;
};

}
