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

    Copyright Topology LP 2017
*/

#ifndef __TGC_ERRORS_H__
#define __TGC_ERRORS_H__

#include <cstdint>
#include <stdexcept>
#include <string>

// Missing credentials or collaborators when a user agent is created.
class tgc_configuration_error: public std::invalid_argument
{
public:
    explicit tgc_configuration_error(const std::string& what): std::invalid_argument(what) { }
};

// The library was called in a way that can never succeed.
class tgc_usage_error: public std::logic_error
{
public:
    explicit tgc_usage_error(const std::string& what): std::logic_error(what) { }
};

// An error returned by the server for a query.
class tgc_rpc_error: public std::runtime_error
{
public:
    tgc_rpc_error(int error_code, const std::string& error_string);

    int error_code() const { return m_error_code; }
    const std::string& error_string() const { return m_error_string; }

private:
    int m_error_code;
    std::string m_error_string;
};

// USER_MIGRATE_X, PHONE_MIGRATE_X and NETWORK_MIGRATE_X.
class tgc_dc_redirect_error: public tgc_rpc_error
{
public:
    tgc_dc_redirect_error(int error_code, const std::string& error_string, int32_t new_dc)
        : tgc_rpc_error(error_code, error_string)
        , m_new_dc(new_dc)
    { }

    int32_t new_dc() const { return m_new_dc; }

private:
    int32_t m_new_dc;
};

class tgc_transfer_error: public std::runtime_error
{
public:
    explicit tgc_transfer_error(const std::string& what, int32_t part_index = -1)
        : std::runtime_error(what)
        , m_part_index(part_index)
    { }

    // -1 when the error is not tied to a part.
    int32_t part_index() const { return m_part_index; }

private:
    int32_t m_part_index;
};

class tgc_connection_error: public std::runtime_error
{
public:
    explicit tgc_connection_error(const std::string& what): std::runtime_error(what) { }
};

// Returns the data center named by a migration error or -1.
int32_t tgc_dc_from_migration_error(int error_code, const std::string& error_string);

#endif
