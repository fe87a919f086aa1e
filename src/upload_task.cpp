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

#include "upload_task.h"

#include "tgc/tgc_errors.h"

namespace tgc {
namespace impl {

upload_task::upload_task(int64_t id, const std::string& file_path, const std::string& file_name, size_t part_size)
    : id(id)
    , part_num(0)
    , part_size(part_size)
    , uploaded_bytes(0)
    , file_path(file_path)
    , file_name(file_name)
    , m_stream(boost::filesystem::path(file_path), std::ios::in | std::ios::binary)
{
    if (!m_stream) {
        throw tgc_transfer_error("could not open " + file_path + " for reading");
    }
}

std::vector<char> upload_task::read_part()
{
    std::vector<char> part(part_size);
    m_stream.read(part.data(), part.size());
    if (m_stream.bad()) {
        throw tgc_transfer_error("failed to read " + file_path, part_num);
    }
    part.resize(static_cast<size_t>(m_stream.gcount()));
    return part;
}

void upload_task::part_uploaded(const std::vector<char>& part)
{
    m_md5.update(part.data(), part.size());
    uploaded_bytes += part.size();
    ++part_num;
    if (progress) {
        progress(uploaded_bytes);
    }
}

tgc_input_file upload_task::finish()
{
    tgc_input_file file;
    file.id = id;
    file.parts = part_num;
    file.name = file_name;
    file.md5_checksum = m_md5.hex_digest();
    return file;
}

}
}
