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

#include "crypto/crypto_md5.h"
#include "tgc/tgc_file_location.h"
#include "tgc/tgc_transfer_manager.h"

#include <boost/filesystem/fstream.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace tgc {
namespace impl {

class upload_task {
public:
    int64_t id;
    int32_t part_num;
    size_t part_size;
    int64_t uploaded_bytes;
    std::string file_path;
    std::string file_name;
    tgc_transfer_progress_callback progress;

    // Throws tgc_transfer_error when the file can not be opened.
    upload_task(int64_t id, const std::string& file_path, const std::string& file_name, size_t part_size);

    // Empty at the end of the file.
    std::vector<char> read_part();

    // Called once the server acknowledged the part returned by read_part.
    void part_uploaded(const std::vector<char>& part);

    tgc_input_file finish();

private:
    boost::filesystem::ifstream m_stream;
    crypto_md5 m_md5;
};

}
}
