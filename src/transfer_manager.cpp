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

#include "transfer_manager.h"

#include "download_task.h"
#include "mtproto_client.h"
#include "tgc/query/query_upload_get_file.h"
#include "tgc/query/query_upload_save_file_part.h"
#include "tgc/tgc_errors.h"
#include "tgc/tgc_log.h"
#include "tgc/tgc_mime_type.h"
#include "tools.h"
#include "upload_task.h"

#include <boost/filesystem.hpp>

#include <cmath>
#include <limits>
#include <stdexcept>

namespace tgc {
namespace impl {

size_t part_size_in_bytes(double part_size_kb)
{
    double bytes = std::floor(part_size_kb * 1024);
    if (!(bytes > 0) || std::fmod(bytes, 1024) != 0
            || bytes > static_cast<double>(std::numeric_limits<int32_t>::max())) {
        throw std::invalid_argument("the part size must be a positive multiple of 1024 bytes");
    }
    return static_cast<size_t>(bytes);
}

class document_name_visitor: public boost::static_visitor<void>
{
public:
    void operator()(const tgc_document_attribute_filename& attribute)
    {
        if (!file_name) {
            file_name = attribute.file_name;
        }
    }

    void operator()(const tgc_document_attribute_audio& attribute)
    {
        if (!audio_name) {
            audio_name = attribute.performer + " - " + attribute.title;
        }
    }

    void operator()(const tgc_document_attribute_image_size&) { }
    void operator()(const tgc_document_attribute_other&) { }

    boost::optional<std::string> file_name;
    boost::optional<std::string> audio_name;
};

std::string safe_file_name(const std::string& name)
{
    std::string base = boost::filesystem::path(name).filename().string();
    if (base.empty() || base == "." || base == ".." || base.find('/') != std::string::npos) {
        return std::string();
    }
    return base;
}

std::string document_file_name(const tgc_document& document)
{
    document_name_visitor visitor;
    for (const auto& attribute: document.attributes) {
        boost::apply_visitor(visitor, attribute);
    }

    std::string name;
    if (visitor.file_name) {
        name = safe_file_name(*visitor.file_name);
    }
    if (name.empty() && visitor.audio_name) {
        name = safe_file_name(*visitor.audio_name);
    }

    if (name.empty()) {
        TGC_WARNING("could not determine a name for document " << document.id);
    }
    return name;
}

class media_downloader: public boost::static_visitor<boost::optional<std::string>>
{
public:
    media_downloader(transfer_manager& manager, const std::string& path, bool add_extension)
        : m_manager(manager)
        , m_path(path)
        , m_add_extension(add_extension)
    { }

    boost::optional<std::string> operator()(const tgc_message_media_none&) const
    {
        return boost::none;
    }

    boost::optional<std::string> operator()(const tgc_message_media_photo& media) const
    {
        return m_manager.download_photo(media, m_path, m_add_extension);
    }

    boost::optional<std::string> operator()(const tgc_message_media_document& media) const
    {
        return m_manager.download_document(media, m_path, m_add_extension);
    }

    boost::optional<std::string> operator()(const tgc_message_media_contact& media) const
    {
        return tgc_export_contact(media, m_path, m_add_extension);
    }

    boost::optional<std::string> operator()(const tgc_message_media_unsupported&) const
    {
        TGC_DEBUG("nothing to download for unsupported media");
        return boost::none;
    }

private:
    transfer_manager& m_manager;
    const std::string& m_path;
    bool m_add_extension;
};

tgc_input_file transfer_manager::upload_file(const std::string& path, const boost::optional<double>& part_size_kb,
        const boost::optional<std::string>& file_name,
        const tgc_transfer_progress_callback& progress)
{
    size_t part_size = part_size_in_bytes(part_size_kb.value_or(m_default_part_size_kb));
    std::string name = file_name ? *file_name : boost::filesystem::path(path).filename().string();

    upload_task u(tgc_next_file_id(), path, name, part_size);
    u.progress = progress;

    TGC_DEBUG("uploading " << path << " as file " << u.id << " in parts of " << part_size << " bytes");

    while (true) {
        std::vector<char> part = u.read_part();
        if (part.empty()) {
            break;
        }

        auto q = std::make_shared<query_upload_save_file_part>(u.id, u.part_num, std::move(part));
        if (!m_client->invoke(q)) {
            throw tgc_transfer_error("part " + std::to_string(u.part_num) + " of " + path + " was not saved", u.part_num);
        }

        u.part_uploaded(q->bytes());
        TGC_DEBUG("uploaded part " << q->part() << " of " << path << ", " << u.uploaded_bytes << " bytes so far");
    }

    TGC_NOTICE("uploaded " << path << " in " << u.part_num << " parts");
    return u.finish();
}

tgc_storage_file_type transfer_manager::download_file_location(const tgc_file_location& location,
        const std::string& path, const boost::optional<double>& part_size_kb,
        const tgc_transfer_progress_callback& progress)
{
    int32_t part_size = static_cast<int32_t>(part_size_in_bytes(part_size_kb.value_or(m_default_part_size_kb)));

    download_task d(location, path, part_size);
    d.progress = progress;

    while (true) {
        auto q = std::make_shared<query_upload_get_file>(location, d.request_offset(), d.part_size);
        tgc_upload_file part = m_client->invoke(q);
        if (part.bytes.empty()) {
            d.close();
            TGC_NOTICE("downloaded " << d.downloaded_bytes << " bytes to " << path << " (" << to_string(part.type) << ")");
            return part.type;
        }

        d.write_part(part);
        TGC_DEBUG("downloaded " << d.downloaded_bytes << " bytes of " << path);
    }
}

std::string transfer_manager::download_photo(const tgc_message_media_photo& media,
        const std::string& path, bool add_extension)
{
    if (media.photo.sizes.empty()) {
        throw tgc_transfer_error("photo " + std::to_string(media.photo.id) + " has no sizes");
    }

    std::string file_path = path;
    if (add_extension) {
        file_path += ".jpg";
    }

    download_file_location(media.photo.sizes.back().location, file_path);
    return file_path;
}

std::string transfer_manager::download_document(const tgc_message_media_document& media,
        const boost::optional<std::string>& path, bool add_extension)
{
    const tgc_document& document = media.document;

    std::string file_path = path ? *path : document_file_name(document);
    if (file_path.empty()) {
        throw tgc_transfer_error("could not determine a name for document " + std::to_string(document.id));
    }
    if (add_extension) {
        file_path += tgc_extension_by_mime_type(document.mime_type);
    }

    download_file_location(tgc_input_document_file_location(document.id, document.access_hash, document.version),
            file_path);
    return file_path;
}

boost::optional<std::string> transfer_manager::download_media(const tgc_message_media& media,
        const std::string& path, bool add_extension)
{
    TGC_DEBUG("downloading media of type " << static_cast<int>(tgc_media_type_of(media)) << " to " << path);
    return boost::apply_visitor(media_downloader(*this, path, add_extension), media);
}

}
}
