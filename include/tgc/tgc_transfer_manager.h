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

#ifndef __TGC_TRANSFER_MANAGER_H__
#define __TGC_TRANSFER_MANAGER_H__

#include "tgc_file_location.h"
#include "tgc_message_media.h"

#include <boost/optional.hpp>

#include <cstdint>
#include <functional>
#include <string>

// Called after every part with the number of bytes moved so far.
using tgc_transfer_progress_callback = std::function<void(int64_t transferred_bytes)>;

static constexpr int32_t TGC_DEFAULT_PART_SIZE_KB = 64;

// Transfers run synchronously, one part at a time, in order. Part sizes are
// given in kilobytes; the size in bytes must be a positive multiple of 1024
// no larger than 512 KB. Without one the configured default is used.
class tgc_transfer_manager
{
public:
    virtual ~tgc_transfer_manager() { }

    virtual tgc_input_file upload_file(const std::string& path,
            const boost::optional<double>& part_size_kb = boost::none,
            const boost::optional<std::string>& file_name = boost::none,
            const tgc_transfer_progress_callback& progress = nullptr) = 0;

    // Returns the storage type reported with the final, empty, chunk.
    virtual tgc_storage_file_type download_file_location(const tgc_file_location& location,
            const std::string& path,
            const boost::optional<double>& part_size_kb = boost::none,
            const tgc_transfer_progress_callback& progress = nullptr) = 0;

    // The largest size is downloaded.
    virtual std::string download_photo(const tgc_message_media_photo& media,
            const std::string& path, bool add_extension = true) = 0;

    virtual std::string download_document(const tgc_message_media_document& media,
            const boost::optional<std::string>& path = boost::none, bool add_extension = true) = 0;

    // Photos, documents and contacts. Nothing is written for other media.
    virtual boost::optional<std::string> download_media(const tgc_message_media& media,
            const std::string& path, bool add_extension = true) = 0;
};

// Writes the contact as a vCard 4.0 and returns the path written.
std::string tgc_export_contact(const tgc_message_media_contact& contact,
        const std::string& path, bool add_extension = true);

#endif
