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

#include "tgc/tgc_query.h"

#include <cstdint>
#include <memory>

namespace tgc {

class query_invoke_with_layer: public query
{
public:
    query_invoke_with_layer(int32_t layer, const std::shared_ptr<query>& q);

    int32_t layer() const { return m_layer; }
    const std::shared_ptr<query>& wrapped_query() const { return m_query; }

    virtual void accept(query_visitor& visitor) override { visitor.visit(*this); }
    virtual query& answer_holder() override { return m_query->answer_holder(); }
    virtual void handle_error(int error_code, const std::string& error_string) override;
    virtual void reset() override;

private:
    int32_t m_layer;
    std::shared_ptr<query> m_query;
};

}
