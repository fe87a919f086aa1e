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

#include "tgc/tgc_dc.h"
#include "tgc/tgc_query.h"

#include <cstdint>
#include <vector>

struct tgc_config {
    int32_t date;
    bool test_mode;
    int32_t this_dc;
    int32_t chat_size_max;
    std::vector<tgc_dc_option> dc_options;

    tgc_config(): date(0), test_mode(false), this_dc(0), chat_size_max(0) { }
};

namespace tgc {

class query_help_get_config: public query_with_result<tgc_config>
{
public:
    query_help_get_config()
        : query_with_result<tgc_config>("get config")
    { }

    virtual void accept(query_visitor& visitor) override { visitor.visit(*this); }
};

}
