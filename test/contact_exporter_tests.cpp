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

#include <catch2/catch.hpp>

#include "temp_directory.h"

#include "tgc/tgc_transfer_manager.h"

using namespace tgc::test;

TEST_CASE("contacts are exported as vCards", "[contact_exporter]") {
    temp_directory dir;

    SECTION("with a last name") {
        tgc_message_media_contact contact("Ana", std::string("Ruiz"), "15551234567");
        std::string path = tgc_export_contact(contact, dir.path("ana"));
        REQUIRE(path == dir.path("ana.vcard"));
        REQUIRE(read_file(path) ==
                "BEGIN:VCARD\n"
                "VERSION:4.0\n"
                "N:Ana;Ruiz;;;\n"
                "FN:Ana Ruiz\n"
                "TEL;TYPE=cell;VALUE=uri:tel:+15551234567\n"
                "END:VCARD\n");
    }

    SECTION("without a last name") {
        tgc_message_media_contact contact("Ana", boost::none, "15551234567");
        std::string path = tgc_export_contact(contact, dir.path("contacts/ana.vcf"), false);
        REQUIRE(path == dir.path("contacts/ana.vcf"));
        std::string content = read_file(path);
        REQUIRE(content.find("N:Ana;;;;\n") != std::string::npos);
        REQUIRE(content.find("FN:Ana\n") != std::string::npos);
    }
}
