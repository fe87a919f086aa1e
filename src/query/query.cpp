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

#include "tgc/tgc_query.h"

#include "tgc/query/query_init_connection.h"
#include "tgc/query/query_invoke_with_layer.h"
#include "tgc/tgc_log.h"

namespace tgc {

void query::handle_error(int error_code, const std::string& error_string)
{
    TGC_DEBUG("error for query \"" << m_name << "\": " << error_code << " " << error_string);
    m_error_code = error_code ? error_code : 500;
    m_error_string = error_string;
}

void query::reset()
{
    m_answered = false;
    m_error_code = 0;
    m_error_string.clear();
}

query_invoke_with_layer::query_invoke_with_layer(int32_t layer, const std::shared_ptr<query>& q)
    : query("invoke with layer")
    , m_layer(layer)
    , m_query(q)
{
}

void query_invoke_with_layer::handle_error(int error_code, const std::string& error_string)
{
    m_query->handle_error(error_code, error_string);
}

void query_invoke_with_layer::reset()
{
    query::reset();
    m_query->reset();
}

query_init_connection::query_init_connection(int32_t api_id,
        const std::string& device_model, const std::string& system_version,
        const std::string& app_version, const std::string& lang_code,
        const std::shared_ptr<query>& q)
    : query("init connection")
    , m_api_id(api_id)
    , m_device_model(device_model)
    , m_system_version(system_version)
    , m_app_version(app_version)
    , m_lang_code(lang_code)
    , m_query(q)
{
}

void query_init_connection::handle_error(int error_code, const std::string& error_string)
{
    m_query->handle_error(error_code, error_string);
}

void query_init_connection::reset()
{
    query::reset();
    m_query->reset();
}

}
