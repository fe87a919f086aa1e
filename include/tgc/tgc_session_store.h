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

#ifndef __TGC_SESSION_STORE_H__
#define __TGC_SESSION_STORE_H__

#include "tgc_session.h"

#include <memory>
#include <string>

class tgc_session_store {
public:
    virtual ~tgc_session_store() { }

    // Never null: an unknown id gives tgc_session::create(session_id, test_mode).
    virtual std::shared_ptr<tgc_session> load(const std::string& session_id, bool test_mode) = 0;

    virtual void save(const tgc_session& session) = 0;
};

#endif
