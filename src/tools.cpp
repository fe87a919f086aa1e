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

#include "tools.h"

#include "tgc/tgc_log.h"

#include <sys/utsname.h>

#include <atomic>
#include <cerrno>
#include <cstring>

int64_t tgc_next_file_id()
{
    static std::atomic<int64_t> last_id(0);

    int64_t id = tgc_get_system_time_us();
    int64_t last = last_id.load();
    do {
        if (id <= last) {
            id = last + 1;
        }
    } while (!last_id.compare_exchange_weak(last, id));

    return id;
}

static bool read_uname(struct utsname& name)
{
    if (uname(&name) != 0) {
        TGC_WARNING("uname failed: " << strerror(errno));
        return false;
    }
    return true;
}

std::string tgc_device_model()
{
    struct utsname name;
    if (!read_uname(name)) {
        return std::string();
    }
    return name.machine;
}

std::string tgc_system_version()
{
    struct utsname name;
    if (!read_uname(name)) {
        return std::string();
    }
    return std::string(name.sysname) + " " + name.release;
}
