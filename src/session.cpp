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

    Copyright Topology LP 2016
*/

#include "tgc/tgc_dc.h"
#include "tgc/tgc_session.h"

const char* tgc_default_server_address(bool test_mode)
{
    return test_mode ? TG_SERVER_TEST_1 : TG_SERVER_2;
}

std::shared_ptr<tgc_session> tgc_session::create(const std::string& session_id, bool test_mode)
{
    auto session = std::make_shared<tgc_session>();
    session->session_id = session_id;
    session->server_address = tgc_default_server_address(test_mode);
    session->port = TG_SERVER_PORT;
    return session;
}
