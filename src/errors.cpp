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

#include "tgc/tgc_errors.h"

#include <boost/lexical_cast.hpp>

constexpr int TGC_MAX_DC_NUM = 100;

static std::string rpc_error_description(int error_code, const std::string& error_string)
{
    return "RPC_CALL_FAIL " + std::to_string(error_code) + " " + error_string;
}

tgc_rpc_error::tgc_rpc_error(int error_code, const std::string& error_string)
    : std::runtime_error(rpc_error_description(error_code, error_string))
    , m_error_code(error_code)
    , m_error_string(error_string)
{
}

static bool get_int_from_prefixed_string(int& number, const std::string& prefixed_string, const std::string& prefix)
{
    if (prefixed_string.size() < prefix.size() + 1 || prefixed_string.compare(0, prefix.size(), prefix)) {
        return false;
    }

    return boost::conversion::try_lexical_convert(prefixed_string.substr(prefix.size()), number);
}

int32_t tgc_dc_from_migration_error(int error_code, const std::string& error_string)
{
    if (error_code != 303) {
        return -1;
    }

    int dc = -1;
    if (!get_int_from_prefixed_string(dc, error_string, "USER_MIGRATE_")
            && !get_int_from_prefixed_string(dc, error_string, "PHONE_MIGRATE_")
            && !get_int_from_prefixed_string(dc, error_string, "NETWORK_MIGRATE_")) {
        return -1;
    }

    if (dc <= 0 || dc >= TGC_MAX_DC_NUM) {
        return -1;
    }

    return dc;
}
