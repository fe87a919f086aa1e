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

#include "download_task.h"
#include "fake_backend.h"
#include "temp_directory.h"
#include "transfer_manager.h"

#include "tgc/tgc_errors.h"

#include <boost/filesystem.hpp>

#include <stdexcept>

using namespace tgc;
using namespace tgc::test;

static tgc_photo_size photo_size(const std::string& type, int64_t volume_id, int32_t width)
{
    tgc_photo_size size;
    size.type = type;
    size.location = tgc_input_file_location(volume_id, 1, 99);
    size.width = width;
    size.height = width;
    return size;
}

TEST_CASE("download_file_location writes the chunks in order", "[download]") {
    fake_backend backend;
    auto client = backend.make_client();
    REQUIRE(client->connect());
    impl::transfer_manager manager(client, 64);
    temp_directory dir;

    std::string data = pattern_data(150000);
    backend.server->download_data = data;
    backend.server->download_type = tgc_storage_file_type::png;
    std::vector<int64_t> progress;

    std::string path = dir.path("nested/more/file.png");
    auto type = manager.download_file_location(tgc_input_file_location(1, 2, 3), path, 64.0,
            [&](int64_t bytes) { progress.push_back(bytes); });

    REQUIRE(type == tgc_storage_file_type::png);
    REQUIRE(read_file(path) == data);
    REQUIRE(backend.server->requested_offsets == (std::vector<int32_t>{ 0, 65536, 131072, 196608 }));
    REQUIRE(progress == (std::vector<int64_t>{ 65536, 131072, 150000 }));
}

TEST_CASE("download_file_location edge cases", "[download]") {
    fake_backend backend;
    auto client = backend.make_client();
    REQUIRE(client->connect());
    impl::transfer_manager manager(client, 64);
    temp_directory dir;

    SECTION("an empty file") {
        backend.server->download_type = tgc_storage_file_type::unknown;
        std::string path = dir.path("empty");
        REQUIRE(manager.download_file_location(tgc_input_file_location(), path) == tgc_storage_file_type::unknown);
        REQUIRE(boost::filesystem::exists(path));
        REQUIRE(read_file(path).empty());
    }

    SECTION("an existing file is overwritten") {
        backend.server->download_data = "abc";
        std::string path = dir.path("file");
        dir.write_file("file", "an older and longer content");
        manager.download_file_location(tgc_input_file_location(), path, 1.0);
        REQUIRE(read_file(path) == "abc");
    }

    SECTION("a bad part size") {
        REQUIRE_THROWS_AS(manager.download_file_location(tgc_input_file_location(), dir.path("file"), 3.3),
                std::invalid_argument);
        REQUIRE(backend.server->requested_offsets.empty());
    }

    SECTION("an unwritable destination") {
        dir.write_file("blocker", "not a directory");
        REQUIRE_THROWS_AS(manager.download_file_location(tgc_input_file_location(), dir.path("blocker/file"), 1.0),
                tgc_transfer_error);
        REQUIRE(backend.server->requested_offsets.empty());
    }
}

TEST_CASE("download_photo picks the largest size", "[download]") {
    fake_backend backend;
    auto client = backend.make_client();
    REQUIRE(client->connect());
    impl::transfer_manager manager(client, 64);
    temp_directory dir;
    backend.server->download_data = "jpeg bytes";

    tgc_message_media_photo media;
    media.photo.id = 42;
    media.photo.sizes.push_back(photo_size("s", 10, 90));
    media.photo.sizes.push_back(photo_size("m", 20, 320));
    media.photo.sizes.push_back(photo_size("x", 30, 800));

    SECTION("with an extension") {
        std::string path = manager.download_photo(media, dir.path("photo"));
        REQUIRE(path == dir.path("photo.jpg"));
        REQUIRE(read_file(path) == "jpeg bytes");
        auto location = boost::get<tgc_input_file_location>(backend.server->requested_locations.front());
        REQUIRE(location.volume_id == 30);
    }

    SECTION("without an extension") {
        std::string path = manager.download_photo(media, dir.path("photo"), false);
        REQUIRE(path == dir.path("photo"));
        REQUIRE(boost::filesystem::exists(path));
    }

    SECTION("without sizes") {
        media.photo.sizes.clear();
        REQUIRE_THROWS_AS(manager.download_photo(media, dir.path("photo")), tgc_transfer_error);
    }
}

TEST_CASE("document names", "[download]") {
    tgc_document document;

    SECTION("no attributes") {
        REQUIRE(impl::document_file_name(document).empty());
    }

    SECTION("audio") {
        tgc_document_attribute_audio audio;
        audio.performer = "Nina Simone";
        audio.title = "Sinnerman";
        document.attributes.push_back(audio);
        REQUIRE(impl::document_file_name(document) == "Nina Simone - Sinnerman");
    }

    SECTION("the file name wins over audio") {
        tgc_document_attribute_audio audio;
        audio.performer = "Nina Simone";
        audio.title = "Sinnerman";
        document.attributes.push_back(tgc_document_attribute_image_size());
        document.attributes.push_back(audio);
        document.attributes.push_back(tgc_document_attribute_filename("song.mp3"));
        REQUIRE(impl::document_file_name(document) == "song.mp3");
    }
}

TEST_CASE("document names from the sender are reduced to a file name", "[download]") {
    tgc_document document;

    SECTION("an absolute path") {
        document.attributes.push_back(tgc_document_attribute_filename("/tmp/elsewhere/escaped.bin"));
        REQUIRE(impl::document_file_name(document) == "escaped.bin");
    }

    SECTION("parent directory components") {
        document.attributes.push_back(tgc_document_attribute_filename("../../home/user/.profile"));
        REQUIRE(impl::document_file_name(document) == ".profile");
    }

    SECTION("names that are not files") {
        REQUIRE(impl::safe_file_name("..").empty());
        REQUIRE(impl::safe_file_name(".").empty());
        REQUIRE(impl::safe_file_name("").empty());
        REQUIRE(impl::safe_file_name("/").empty());
        REQUIRE(impl::safe_file_name("uploads/").empty());
    }

    SECTION("an unusable file name falls back to the audio name") {
        tgc_document_attribute_audio audio;
        audio.performer = "Nina Simone";
        audio.title = "Sinnerman";
        document.attributes.push_back(tgc_document_attribute_filename(".."));
        document.attributes.push_back(audio);
        REQUIRE(impl::document_file_name(document) == "Nina Simone - Sinnerman");
    }
}

TEST_CASE("download_document without a name", "[download]") {
    fake_backend backend;
    auto client = backend.make_client();
    REQUIRE(client->connect());
    impl::transfer_manager manager(client, 64);
    backend.server->download_data = "%PDF-1.4";

    tgc_message_media_document media;
    media.document.id = 5;
    media.document.mime_type = "application/pdf";

    SECTION("no attributes") {
        REQUIRE_THROWS_AS(manager.download_document(media), tgc_transfer_error);
    }

    SECTION("only unusable names") {
        media.document.attributes.push_back(tgc_document_attribute_filename("../"));
        REQUIRE_THROWS_AS(manager.download_document(media, boost::none, false), tgc_transfer_error);
    }

    REQUIRE(backend.server->requested_offsets.empty());
    REQUIRE_FALSE(boost::filesystem::exists(".pdf"));
}

TEST_CASE("download offsets beyond 32 bits", "[download]") {
    temp_directory dir;
    impl::download_task d(tgc_input_file_location(), dir.path("large"), 512 * 1024);

    d.part_num = 4095;
    REQUIRE(d.offset() == 2147483648LL - 512 * 1024);
    REQUIRE(d.request_offset() == 2147483648LL - 512 * 1024);

    d.part_num = 4096;
    REQUIRE(d.offset() == 2147483648LL);
    REQUIRE_THROWS_AS(d.request_offset(), tgc_transfer_error);
}

TEST_CASE("download_document", "[download]") {
    fake_backend backend;
    auto client = backend.make_client();
    REQUIRE(client->connect());
    impl::transfer_manager manager(client, 64);
    temp_directory dir;
    backend.server->download_data = "%PDF-1.4";

    tgc_message_media_document media;
    media.document.id = 5;
    media.document.access_hash = 6;
    media.document.version = 7;
    media.document.mime_type = "application/pdf";

    std::string path = manager.download_document(media, dir.path("paper"));
    REQUIRE(path == dir.path("paper.pdf"));
    REQUIRE(read_file(path) == "%PDF-1.4");

    auto location = boost::get<tgc_input_document_file_location>(backend.server->requested_locations.front());
    REQUIRE(location.id == 5);
    REQUIRE(location.access_hash == 6);
    REQUIRE(location.version == 7);

    media.document.mime_type = "application/x-unheard-of";
    REQUIRE(manager.download_document(media, dir.path("blob")) == dir.path("blob"));
    REQUIRE(manager.download_document(media, dir.path("plain.pdf"), false) == dir.path("plain.pdf"));
}

TEST_CASE("download_media dispatches on the media kind", "[download]") {
    fake_backend backend;
    auto client = backend.make_client();
    REQUIRE(client->connect());
    impl::transfer_manager manager(client, 64);
    temp_directory dir;
    backend.server->download_data = "bytes";

    REQUIRE_FALSE(manager.download_media(tgc_message_media_none(), dir.path("none")));
    REQUIRE_FALSE(manager.download_media(tgc_message_media_unsupported(), dir.path("unsupported")));
    REQUIRE(backend.server->requested_offsets.empty());

    tgc_message_media_photo photo;
    photo.photo.sizes.push_back(photo_size("x", 1, 100));
    REQUIRE(manager.download_media(photo, dir.path("photo")) == std::string(dir.path("photo.jpg")));

    tgc_message_media_document document;
    document.document.mime_type = "audio/mpeg";
    document.document.attributes.push_back(tgc_document_attribute_filename("ignored.mp3"));
    REQUIRE(manager.download_media(document, dir.path("song")) == std::string(dir.path("song.mp3")));

    tgc_message_media_contact contact("Ana", std::string("Ruiz"), "15551234567");
    auto path = manager.download_media(contact, dir.path("ana"));
    REQUIRE(path == std::string(dir.path("ana.vcard")));
    REQUIRE(read_file(*path).find("FN:Ana Ruiz\n") != std::string::npos);
}

TEST_CASE("media kinds", "[download]") {
    REQUIRE(tgc_media_type_of(tgc_message_media_none()) == tgc_message_media_type::none);
    REQUIRE(tgc_media_type_of(tgc_message_media_photo()) == tgc_message_media_type::photo);
    REQUIRE(tgc_media_type_of(tgc_message_media_document()) == tgc_message_media_type::document);
    REQUIRE(tgc_media_type_of(tgc_message_media_contact()) == tgc_message_media_type::contact);
    REQUIRE(tgc_media_type_of(tgc_message_media_unsupported()) == tgc_message_media_type::unsupported);
}
