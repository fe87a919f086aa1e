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

#include "tgc/tgc_mime_type.h"

#include <algorithm>
#include <cctype>
#include <map>

static const std::string s_default_mime_type("application/octet-stream");

// Extensions without the dot. The first extension listed for a type is the
// one used when naming downloaded files.
static const std::map<std::string, std::string> s_extension_to_mime = {
    { "3gp", "video/3gpp" },
    { "aac", "audio/aac" },
    { "avi", "video/x-msvideo" },
    { "bmp", "image/bmp" },
    { "css", "text/css" },
    { "csv", "text/csv" },
    { "doc", "application/msword" },
    { "docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document" },
    { "flac", "audio/flac" },
    { "gif", "image/gif" },
    { "gz", "application/gzip" },
    { "htm", "text/html" },
    { "html", "text/html" },
    { "jpe", "image/jpeg" },
    { "jpeg", "image/jpeg" },
    { "jpg", "image/jpeg" },
    { "js", "application/javascript" },
    { "json", "application/json" },
    { "m4a", "audio/mp4" },
    { "mkv", "video/x-matroska" },
    { "mov", "video/quicktime" },
    { "mp3", "audio/mpeg" },
    { "mp4", "video/mp4" },
    { "mpeg", "video/mpeg" },
    { "oga", "audio/ogg" },
    { "ogg", "audio/ogg" },
    { "ogv", "video/ogg" },
    { "opus", "audio/opus" },
    { "pdf", "application/pdf" },
    { "png", "image/png" },
    { "ppt", "application/vnd.ms-powerpoint" },
    { "pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation" },
    { "rar", "application/x-rar-compressed" },
    { "svg", "image/svg+xml" },
    { "tar", "application/x-tar" },
    { "tgs", "application/x-tgsticker" },
    { "tif", "image/tiff" },
    { "tiff", "image/tiff" },
    { "txt", "text/plain" },
    { "vcard", "text/vcard" },
    { "vcf", "text/vcard" },
    { "wav", "audio/x-wav" },
    { "webm", "video/webm" },
    { "webp", "image/webp" },
    { "xls", "application/vnd.ms-excel" },
    { "xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet" },
    { "xml", "application/xml" },
    { "zip", "application/zip" },
};

static const std::map<std::string, std::string> s_mime_to_extension = {
    { "application/gzip", "gz" },
    { "application/javascript", "js" },
    { "application/json", "json" },
    { "application/msword", "doc" },
    { "application/pdf", "pdf" },
    { "application/vnd.ms-excel", "xls" },
    { "application/vnd.ms-powerpoint", "ppt" },
    { "application/vnd.openxmlformats-officedocument.presentationml.presentation", "pptx" },
    { "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet", "xlsx" },
    { "application/vnd.openxmlformats-officedocument.wordprocessingml.document", "docx" },
    { "application/x-rar-compressed", "rar" },
    { "application/x-tar", "tar" },
    { "application/x-tgsticker", "tgs" },
    { "application/xml", "xml" },
    { "application/zip", "zip" },
    { "audio/aac", "aac" },
    { "audio/flac", "flac" },
    { "audio/mp4", "m4a" },
    { "audio/mpeg", "mp3" },
    { "audio/ogg", "ogg" },
    { "audio/opus", "opus" },
    { "audio/x-wav", "wav" },
    { "image/bmp", "bmp" },
    { "image/gif", "gif" },
    { "image/jpeg", "jpg" },
    { "image/png", "png" },
    { "image/svg+xml", "svg" },
    { "image/tiff", "tif" },
    { "image/webp", "webp" },
    { "text/css", "css" },
    { "text/csv", "csv" },
    { "text/html", "html" },
    { "text/plain", "txt" },
    { "text/vcard", "vcf" },
    { "video/3gpp", "3gp" },
    { "video/mp4", "mp4" },
    { "video/mpeg", "mpeg" },
    { "video/ogg", "ogv" },
    { "video/quicktime", "mov" },
    { "video/webm", "webm" },
    { "video/x-matroska", "mkv" },
    { "video/x-msvideo", "avi" },
};

static std::string to_lower(const std::string& str)
{
    std::string result(str.size(), 0);
    std::transform(str.begin(), str.end(), result.begin(), ::tolower);
    return result;
}

std::string tgc_extension_by_mime_type(const std::string& mime_type)
{
    auto it = s_mime_to_extension.find(to_lower(mime_type));
    if (it != s_mime_to_extension.end()) {
        return "." + it->second;
    }
    return std::string();
}

std::string tgc_mime_type_by_filename(const std::string& filename)
{
    auto dot_pos = filename.rfind('.');
    if (dot_pos == std::string::npos || dot_pos == filename.size() - 1) {
       return s_default_mime_type;
    }
    return tgc_mime_type_by_extension(filename.substr(dot_pos + 1));
}

std::string tgc_mime_type_by_extension(const std::string& extension)
{
    auto it = s_extension_to_mime.find(to_lower(extension));
    if (it != s_extension_to_mime.end()) {
        return it->second;
    }

    return s_default_mime_type;
}
