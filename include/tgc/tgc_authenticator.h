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

#ifndef __TGC_AUTHENTICATOR_H__
#define __TGC_AUTHENTICATOR_H__

#include "tgc_session.h"

class tgc_connection;

struct tgc_auth_key_result {
    tgc_auth_key auth_key;
    double time_offset;

    tgc_auth_key_result(): auth_key(), time_offset(0) { }
};

// Runs the Diffie-Hellman key exchange with the data center at the other
// end of the connection. Throws std::runtime_error when the exchange fails.
class tgc_authenticator {
public:
    virtual tgc_auth_key_result negotiate(tgc_connection& connection) = 0;
    virtual ~tgc_authenticator() { }
};

#endif
