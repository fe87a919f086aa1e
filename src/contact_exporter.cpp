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

#include "tgc/tgc_errors.h"
#include "tgc/tgc_log.h"
#include "tgc/tgc_transfer_manager.h"

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

std::string tgc_export_contact(const tgc_message_media_contact& contact,
        const std::string& path, bool add_extension)
{
    std::string file_path = path;
    if (add_extension) {
        file_path += ".vcard";
    }

    boost::filesystem::path fs_path(file_path);
    boost::system::error_code ec;
    if (fs_path.has_parent_path()) {
        boost::filesystem::create_directories(fs_path.parent_path(), ec);
        if (ec) {
            throw tgc_transfer_error("could not create directory for " + file_path + ": " + ec.message());
        }
    }

    boost::filesystem::ofstream out(fs_path, std::ios::out | std::ios::trunc);
    if (!out) {
        throw tgc_transfer_error("could not open " + file_path + " for writing");
    }

    const std::string last_name = contact.last_name ? *contact.last_name : std::string();
    out << "BEGIN:VCARD\n";
    out << "VERSION:4.0\n";
    out << "N:" << contact.first_name << ";" << last_name << ";;;\n";
    out << "FN:" << contact.first_name;
    if (contact.last_name) {
        out << " " << *contact.last_name;
    }
    out << "\n";
    out << "TEL;TYPE=cell;VALUE=uri:tel:+" << contact.phone_number << "\n";
    out << "END:VCARD\n";

    if (!out) {
        throw tgc_transfer_error("failed to write " + file_path);
    }

    TGC_DEBUG("exported contact " << contact.first_name << " to " << file_path);
    return file_path;
}
