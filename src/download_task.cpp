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

#include "download_task.h"

#include "tgc/tgc_errors.h"

#include <boost/filesystem.hpp>

namespace tgc {
namespace impl {

static boost::filesystem::path prepare_path(const std::string& file_path)
{
    boost::filesystem::path path(file_path);
    if (path.has_parent_path()) {
        boost::system::error_code ec;
        boost::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw tgc_transfer_error("could not create directory for " + file_path + ": " + ec.message());
        }
    }
    return path;
}

download_task::download_task(const tgc_file_location& location, const std::string& file_path, int32_t part_size)
    : location(location)
    , part_num(0)
    , part_size(part_size)
    , downloaded_bytes(0)
    , file_path(file_path)
    , m_stream(prepare_path(file_path), std::ios::out | std::ios::binary | std::ios::trunc)
{
    if (!m_stream) {
        throw tgc_transfer_error("could not open " + file_path + " for writing");
    }
}

int32_t download_task::request_offset() const
{
    int64_t current = offset();
    if (current > std::numeric_limits<int32_t>::max()) {
        throw tgc_transfer_error("offset " + std::to_string(current) + " of " + file_path
                + " is beyond what upload.getFile can address", part_num);
    }
    return static_cast<int32_t>(current);
}

void download_task::write_part(const tgc_upload_file& part)
{
    m_stream.write(part.bytes.data(), part.bytes.size());
    if (!m_stream) {
        throw tgc_transfer_error("failed to write " + file_path, part_num);
    }
    downloaded_bytes += part.bytes.size();
    ++part_num;
    if (progress) {
        progress(downloaded_bytes);
    }
}

void download_task::close()
{
    m_stream.close();
    if (m_stream.fail()) {
        throw tgc_transfer_error("failed to close " + file_path);
    }
}

}
}
