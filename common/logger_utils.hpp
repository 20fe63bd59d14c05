#pragma once

#include <memory>
#include <spdlog/logger.h>

namespace dtrsign::logger {

std::shared_ptr<spdlog::logger> InitLog() noexcept;

} // namespace dtrsign::logger
