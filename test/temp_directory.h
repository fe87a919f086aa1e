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

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

#include <iterator>
#include <string>

namespace tgc {
namespace test {

// A fresh directory under the system temporary directory, removed with
// everything in it on destruction.
class temp_directory
{
public:
    temp_directory()
        : m_path(boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("tgc-test-%%%%-%%%%-%%%%"))
    {
        boost::filesystem::create_directories(m_path);
    }

    ~temp_directory()
    {
        boost::system::error_code ec;
        boost::filesystem::remove_all(m_path, ec);
    }

    temp_directory(const temp_directory&) = delete;
    temp_directory& operator=(const temp_directory&) = delete;

    std::string path(const std::string& name) const { return (m_path / name).string(); }

    std::string write_file(const std::string& name, const std::string& content) const
    {
        std::string file_path = path(name);
        boost::filesystem::ofstream out(file_path, std::ios::out | std::ios::binary);
        out.write(content.data(), content.size());
        return file_path;
    }

private:
    boost::filesystem::path m_path;
};

inline std::string read_file(const std::string& path)
{
    boost::filesystem::ifstream in(path, std::ios::in | std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline std::string pattern_data(size_t size)
{
    std::string data(size, 0);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<char>((i * 31 + 7) % 251);
    }
    return data;
}

}
}
