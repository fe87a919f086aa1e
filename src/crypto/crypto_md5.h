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

#include <openssl/evp.h>

#include <cstddef>
#include <string>

namespace tgc {
namespace impl {

// Incremental MD5 over OpenSSL's EVP interface.
class crypto_md5
{
public:
    crypto_md5();
    ~crypto_md5();

    crypto_md5(const crypto_md5&) = delete;
    crypto_md5& operator=(const crypto_md5&) = delete;

    void update(const void* data, size_t length);

    // Lower case hex. Only valid once.
    std::string hex_digest();

private:
    EVP_MD_CTX* m_context;
    bool m_finished;
};

}
}
