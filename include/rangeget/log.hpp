// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace rangeget::log {

// Shared "rangeget" logger writing to stderr
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

void set_level(spdlog::level::level_enum level);

} // namespace rangeget::log
