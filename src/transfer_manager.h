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

#include "tgc/tgc_transfer_manager.h"

#include <memory>
#include <string>

namespace tgc {
namespace impl {

class mtproto_client;

class transfer_manager: public tgc_transfer_manager
{
public:
    transfer_manager(const std::shared_ptr<mtproto_client>& client, double default_part_size_kb)
        : m_client(client)
        , m_default_part_size_kb(default_part_size_kb)
    { }

    virtual tgc_input_file upload_file(const std::string& path,
            const boost::optional<double>& part_size_kb = boost::none,
            const boost::optional<std::string>& file_name = boost::none,
            const tgc_transfer_progress_callback& progress = nullptr) override;

    virtual tgc_storage_file_type download_file_location(const tgc_file_location& location,
            const std::string& path,
            const boost::optional<double>& part_size_kb = boost::none,
            const tgc_transfer_progress_callback& progress = nullptr) override;

    virtual std::string download_photo(const tgc_message_media_photo& media,
            const std::string& path, bool add_extension = true) override;

    virtual std::string download_document(const tgc_message_media_document& media,
            const boost::optional<std::string>& path = boost::none, bool add_extension = true) override;

    virtual boost::optional<std::string> download_media(const tgc_message_media& media,
            const std::string& path, bool add_extension = true) override;

private:
    std::shared_ptr<mtproto_client> m_client;
    double m_default_part_size_kb;
};

// Throws std::invalid_argument unless the size in bytes is a positive
// multiple of 1024. Sizes the 32-bit limit field can not carry are
// rejected too.
size_t part_size_in_bytes(double part_size_kb);

// The last component of a name chosen by the sender. Empty for names that
// do not denote a file, such as "." or "..".
std::string safe_file_name(const std::string& name);

// The name a document was sent with, reduced to a bare file name, or empty
// when it can not be told.
std::string document_file_name(const tgc_document& document);

}
}
