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

#include "tgc/tgc_file_location.h"
#include "tgc/tgc_query.h"

#include <cstdint>

namespace tgc {

class query_upload_get_file: public query_with_result<tgc_upload_file>
{
public:
    query_upload_get_file(const tgc_file_location& location, int32_t offset, int32_t limit)
        : query_with_result<tgc_upload_file>("download file part")
        , m_location(location)
        , m_offset(offset)
        , m_limit(limit)
    { }

    const tgc_file_location& location() const { return m_location; }
    int32_t offset() const { return m_offset; }
    int32_t limit() const { return m_limit; }

    virtual void accept(query_visitor& visitor) override { visitor.visit(*this); }

private:
    tgc_file_location m_location;
    int32_t m_offset;
    int32_t m_limit;
};

}
