#pragma once
#include "global/globals.hpp"

#include "spdlog/spdlog.h"
template <typename... Args>
inline void log_calculation(spdlog::format_string_t<Args...> fmt, Args&&... args)
{
    if (config().log.calculations)
        spdlog::info(fmt, std::forward<Args>(args)...);
}
