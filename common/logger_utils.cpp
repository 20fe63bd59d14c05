/* File: logger_utils.cpp
Copyright (C) Basealt LLC,  2024
Author: Oleg Proskurin, <proskurinov@basealt.ru>

This program is free software; you can redistribute it and/or
modify it under the terms of the GNU Lesser General Public
License as published by the Free Software Foundation; either
version 3 of the License, or (at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
Lesser General Public License for more details.

You should have received a copy of the GNU Lesser General Public License
along with this program; if not, write to the Free Software Foundation,
Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.
*/

#include "logger_utils.hpp"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/syslog_sink.h"
#include "spdlog/spdlog.h"
#include <iostream>
#include <spdlog/common.h>
#include <syslog.h>

namespace dtrsign::logger {

namespace {
constexpr const char *const kStderrLoggerName = "dtrsign";
constexpr const char *const kSyslogLoggerName = "dtrsign_syslog";
} // namespace

std::shared_ptr<spdlog::logger> InitLog() noexcept {
  try {
    if constexpr (DTRSIGN_LOG_TO_JOURNAL) {
      auto logger = spdlog::get(kSyslogLoggerName);
      if (logger) {
        return logger;
      }
      logger = spdlog::syslog_logger_mt(kSyslogLoggerName, DTRSIGN_LOG_TAG);
      logger->set_level(spdlog::level::debug);
      return logger;
    } else {
      auto logger = spdlog::get(kStderrLoggerName);
      if (logger) {
        return logger;
      }
      logger = spdlog::stderr_color_mt(kStderrLoggerName);
      logger->set_level(spdlog::level::debug);
      return logger;
    }
  } catch (const spdlog::spdlog_ex &ex) {
    // two threads may race to register the same name
    auto logger = spdlog::get(DTRSIGN_LOG_TO_JOURNAL ? kSyslogLoggerName
                                                     : kStderrLoggerName);
    if (logger) {
      return logger;
    }
    std::cerr << ex.what() << "\n";
    openlog(DTRSIGN_LOG_TAG, LOG_PID, LOG_USER);
    syslog(LOG_ERR, "Can't create init log"); // NOLINT
    return nullptr;
  } catch (const std::exception &ex) {
    std::cerr << ex.what() << "\n";
    openlog(DTRSIGN_LOG_TAG, LOG_PID, LOG_USER);
    syslog(LOG_ERR, "Can't create init log"); // NOLINT
    return nullptr;
  }
}

} // namespace dtrsign::logger
