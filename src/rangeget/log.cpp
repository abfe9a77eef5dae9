// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangeget/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace rangeget::log {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto existing = spdlog::get("rangeget");
        if (existing) return existing;
        auto created = spdlog::stderr_color_mt("rangeget");
        created->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        created->set_level(spdlog::level::info);
        return created;
    }();
    return instance;
}

void set_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace rangeget::log
