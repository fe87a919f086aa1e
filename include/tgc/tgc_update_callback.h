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

    Copyright Vitaly Valtman 2014-2015
    Copyright Topology LP 2016
*/

#ifndef __TGC_UPDATE_CALLBACK__
#define __TGC_UPDATE_CALLBACK__

#include "tgc_message.h"

#include <cstdint>
#include <vector>

// Unsolicited updates are delivered by the sender's listener, the login
// notifications by the user agent itself.
class tgc_update_callback {
public:
    virtual void new_messages(const std::vector<tgc_message>& messages) = 0;
    virtual void messages_deleted(const std::vector<int32_t>& message_ids) = 0;
    virtual void status_notification(int32_t user_id, bool online) = 0;
    virtual void logged_in(const tgc_user& user) = 0;
    virtual void logged_out() = 0;
    virtual ~tgc_update_callback() { }
};

#endif
