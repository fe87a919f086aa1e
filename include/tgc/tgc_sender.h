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

#ifndef __TGC_SENDER_H__
#define __TGC_SENDER_H__

#include <memory>

class tgc_connection;
class tgc_update_callback;
struct tgc_session;

namespace tgc {
class query;
}

// Encrypts, frames and serializes queries on one connection. send and
// receive block; receive fills the query with its result or its error.
class tgc_sender {
public:
    virtual void send(tgc::query& q) = 0;
    virtual void receive(tgc::query& q) = 0;

    // Updates arriving between answers are handed to the update callbacks
    // only while listening.
    virtual void set_listen_for_updates(bool listen) = 0;
    virtual void add_update_callback(const std::shared_ptr<tgc_update_callback>& callback) = 0;
    virtual void remove_update_callback(const std::shared_ptr<tgc_update_callback>& callback) = 0;

    virtual void disconnect() = 0;

    virtual ~tgc_sender() { }
};

class tgc_sender_factory {
public:
    virtual std::shared_ptr<tgc_sender> create_sender(const std::shared_ptr<tgc_connection>& connection,
            const std::shared_ptr<tgc_session>& session) = 0;

    virtual ~tgc_sender_factory() { }
};

#endif
