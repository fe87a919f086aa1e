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

#include <boost/optional.hpp>

#include <memory>
#include <stdexcept>
#include <string>

namespace tgc {

class query_visitor;

// A remote procedure call. Every concrete query belongs to the closed set
// listed in query_visitor; a sender serializes it by visiting it and later
// records either its result or its error.
class query: public std::enable_shared_from_this<query>
{
public:
    explicit query(const std::string& name)
        : m_name(name)
        , m_answered(false)
        , m_error_code(0)
    { }

    virtual ~query() { }

    const std::string& name() const { return m_name; }

    virtual void accept(query_visitor& visitor) = 0;

    // Wrapping queries answer with the result of the query they carry.
    virtual query& answer_holder() { return *this; }

    virtual void handle_error(int error_code, const std::string& error_string);

    bool is_answered() const { return m_answered; }
    bool has_error() const { return m_error_code != 0; }
    int error_code() const { return m_error_code; }
    const std::string& error_string() const { return m_error_string; }

    // Forgets the previous answer so the same call can be sent again.
    virtual void reset();

protected:
    void set_answered() { m_answered = true; }

private:
    const std::string m_name;
    bool m_answered;
    int m_error_code;
    std::string m_error_string;
};

template<typename T>
class query_with_result: public query
{
public:
    using result_type = T;

    explicit query_with_result(const std::string& name)
        : query(name)
    { }

    void handle_result(const T& result)
    {
        m_result = result;
        set_answered();
    }

    const T& result() const
    {
        if (!m_result) {
            throw std::logic_error("query \"" + name() + "\" has no result");
        }
        return *m_result;
    }

    virtual void reset() override
    {
        query::reset();
        m_result = boost::none;
    }

private:
    boost::optional<T> m_result;
};

class query_invoke_with_layer;
class query_init_connection;
class query_help_get_config;
class query_send_code;
class query_sign_in;
class query_logout;
class query_upload_save_file_part;
class query_upload_get_file;
class query_messages_get_dialogs;
class query_messages_get_history;
class query_messages_send_message;
class query_messages_send_media;

class query_visitor
{
public:
    virtual ~query_visitor() { }

    virtual void visit(query_invoke_with_layer& q) = 0;
    virtual void visit(query_init_connection& q) = 0;
    virtual void visit(query_help_get_config& q) = 0;
    virtual void visit(query_send_code& q) = 0;
    virtual void visit(query_sign_in& q) = 0;
    virtual void visit(query_logout& q) = 0;
    virtual void visit(query_upload_save_file_part& q) = 0;
    virtual void visit(query_upload_get_file& q) = 0;
    virtual void visit(query_messages_get_dialogs& q) = 0;
    virtual void visit(query_messages_get_history& q) = 0;
    virtual void visit(query_messages_send_message& q) = 0;
    virtual void visit(query_messages_send_media& q) = 0;
};

}
