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

#include "tgc/tgc_message_media.h"

namespace tgc {
namespace impl {

class media_type_visitor: public boost::static_visitor<tgc_message_media_type>
{
public:
    tgc_message_media_type operator()(const tgc_message_media_none&) const { return tgc_message_media_type::none; }
    tgc_message_media_type operator()(const tgc_message_media_photo&) const { return tgc_message_media_type::photo; }
    tgc_message_media_type operator()(const tgc_message_media_document&) const { return tgc_message_media_type::document; }
    tgc_message_media_type operator()(const tgc_message_media_contact&) const { return tgc_message_media_type::contact; }
    tgc_message_media_type operator()(const tgc_message_media_unsupported&) const { return tgc_message_media_type::unsupported; }
};

}
}

tgc_message_media_type tgc_media_type_of(const tgc_message_media& media)
{
    return boost::apply_visitor(tgc::impl::media_type_visitor(), media);
}
