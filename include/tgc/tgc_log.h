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

    Copyright Vitaly Valtman 2014-2015
    Copyright Topology LP 2016
*/

#pragma once

#include <cstdint>
#include <functional>
#include <iostream>
#include <string>
#include <sstream>

enum class tgc_log_level {
    level_error = 0,
    level_warning = 1,
    level_notice = 2,
    level_debug = 6,
};

using tgc_log_function = std::function<void(const std::string& log, tgc_log_level level)>;
void tgc_init_log(const tgc_log_function& log_function, tgc_log_level level);
void tgc_log(const std::string& str, tgc_log_level level);
bool tgc_log_enabled(tgc_log_level level);

constexpr int32_t basename_index(const char* const path, const int32_t index = 0, const int32_t slash_index = -1) {
    return path[index]
        ? (path[index] == '/' ? basename_index(path, index + 1, index) : basename_index(path, index + 1, slash_index))
        : (slash_index + 1);
}

#define STRINGIZE_DETAIL(x) #x
#define STRINGIZE(x) STRINGIZE_DETAIL(x)

#define __FILELINE__ ({ static const int32_t basename_idx = basename_index(__FILE__); \
        static_assert (basename_idx >= 0, "compile-time basename"); \
        __FILE__ ":" STRINGIZE(__LINE__) + basename_idx; })

#define TGC_LOG_AT_LEVEL(LEVEL, X) do { if (tgc_log_enabled(LEVEL)) { std::ostringstream str_stream; \
                    str_stream << "[" << __FILELINE__ << "] [" << __FUNCTION__ << "] " << X ; \
                    tgc_log(str_stream.str(), LEVEL); } } while (false)

#ifndef NDEBUG
#define TGC_DEBUG(X) TGC_LOG_AT_LEVEL(tgc_log_level::level_debug, X)
#else
#define TGC_DEBUG(X)
#endif

#define TGC_NOTICE(X) TGC_LOG_AT_LEVEL(tgc_log_level::level_notice, X)
#define TGC_WARNING(X) TGC_LOG_AT_LEVEL(tgc_log_level::level_warning, X)
#define TGC_ERROR(X) TGC_LOG_AT_LEVEL(tgc_log_level::level_error, X)
