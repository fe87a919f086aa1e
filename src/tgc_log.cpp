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

    Copyright Topology LP 2016
*/

#include "tgc/tgc_log.h"

static tgc_log_function g_log_function;
static tgc_log_level g_log_level = tgc_log_level::level_notice;

void tgc_init_log(const tgc_log_function& log_function, tgc_log_level level)
{
    g_log_function = log_function;
    g_log_level = level;
}

bool tgc_log_enabled(tgc_log_level level)
{
    return level <= g_log_level && g_log_function;
}

void tgc_log(const std::string& str, tgc_log_level level)
{
    if (tgc_log_enabled(level)) {
        g_log_function(str, level);
    }
}
