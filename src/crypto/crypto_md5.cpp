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

#include "crypto_md5.h"

#include "../tools.h"

#include <stdexcept>

namespace tgc {
namespace impl {

crypto_md5::crypto_md5()
    : m_context(EVP_MD_CTX_new())
    , m_finished(false)
{
    if (!m_context || EVP_DigestInit_ex(m_context, EVP_md5(), nullptr) != 1) {
        EVP_MD_CTX_free(m_context);
        throw std::runtime_error("failed to initialize md5 digest");
    }
}

crypto_md5::~crypto_md5()
{
    EVP_MD_CTX_free(m_context);
}

void crypto_md5::update(const void* data, size_t length)
{
    if (m_finished) {
        throw std::logic_error("md5 digest already finished");
    }
    if (length && EVP_DigestUpdate(m_context, data, length) != 1) {
        throw std::runtime_error("failed to update md5 digest");
    }
}

std::string crypto_md5::hex_digest()
{
    if (m_finished) {
        throw std::logic_error("md5 digest already finished");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(m_context, digest, &length) != 1) {
        throw std::runtime_error("failed to finish md5 digest");
    }
    m_finished = true;

    return tgc_binary_to_hex(digest, length);
}

}
}
