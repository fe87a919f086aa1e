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

#ifndef __TGC_DOWNLOAD_TASK_H__
#define __TGC_DOWNLOAD_TASK_H__

#include "tgc/tgc_file_location.h"
#include "tgc/tgc_transfer_manager.h"

#include <boost/filesystem/fstream.hpp>

#include <cstdint>
#include <limits>
#include <string>

namespace tgc {
namespace impl {

class download_task {
public:
    tgc_file_location location;
    int32_t part_num;
    int32_t part_size;
    int64_t downloaded_bytes;
    std::string file_path;
    tgc_transfer_progress_callback progress;

    // Creates the parent directory and truncates the file. Throws
    // tgc_transfer_error when either fails.
    download_task(const tgc_file_location& location, const std::string& file_path, int32_t part_size);

    int64_t offset() const { return static_cast<int64_t>(part_num) * part_size; }

    // The offset as upload.getFile takes it. Throws tgc_transfer_error once
    // it no longer fits in 32 bits.
    int32_t request_offset() const;

    void write_part(const tgc_upload_file& part);
    void close();

private:
    boost::filesystem::ofstream m_stream;
};

}
}

#endif
