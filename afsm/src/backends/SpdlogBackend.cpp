// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-AFSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of AFSM (Async Finite State Machine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (https://www.gnu.org/licenses/old-licenses/lgpl-2.1.html)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Commercial License:
//   Individual: $100 cumulative
//   Enterprise: $500 cumulative
//   Contact: https://github.com/newmassrael

#include "backends/SpdlogBackend.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace AFSM {

SpdlogBackend::SpdlogBackend(const std::string &logDir, bool logToFile) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    sinks.push_back(console_sink);

    if (logToFile && !logDir.empty()) {
        std::filesystem::create_directories(logDir);
        std::filesystem::path logPath = std::filesystem::path(logDir) / "afsm.log";

        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logPath.string(), true);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(file_sink);
    }

    // Not registered globally: several backends may coexist (tests swap them freely)
    logger_ = std::make_shared<spdlog::logger>("AFSM", sinks.begin(), sinks.end());
    logger_->set_level(spdlog::level::debug);

    const char *env_level = std::getenv("SPDLOG_LEVEL");
    if (env_level) {
        auto level = parseLevel(env_level);
        if (level) {
            logger_->set_level(convertLevel(*level));
        }
    }
}

void SpdlogBackend::log(LogLevel level, const std::string &message, [[maybe_unused]] const std::source_location &loc) {
    if (logger_) {
        logger_->log(convertLevel(level), message);
    }
}

void SpdlogBackend::setLevel(LogLevel level) {
    if (logger_) {
        logger_->set_level(convertLevel(level));
    }
}

void SpdlogBackend::flush() {
    if (logger_) {
        logger_->flush();
    }
}

std::optional<LogLevel> SpdlogBackend::parseLevel(const std::string &name) {
    std::string level_str(name);
    std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (level_str == "trace") {
        return LogLevel::Trace;
    } else if (level_str == "debug") {
        return LogLevel::Debug;
    } else if (level_str == "info") {
        return LogLevel::Info;
    } else if (level_str == "warn" || level_str == "warning") {
        return LogLevel::Warn;
    } else if (level_str == "err" || level_str == "error") {
        return LogLevel::Error;
    } else if (level_str == "critical") {
        return LogLevel::Critical;
    } else if (level_str == "off") {
        return LogLevel::Off;
    }
    return std::nullopt;
}

spdlog::level::level_enum SpdlogBackend::convertLevel(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return spdlog::level::trace;
    case LogLevel::Debug:
        return spdlog::level::debug;
    case LogLevel::Info:
        return spdlog::level::info;
    case LogLevel::Warn:
        return spdlog::level::warn;
    case LogLevel::Error:
        return spdlog::level::err;
    case LogLevel::Critical:
        return spdlog::level::critical;
    case LogLevel::Off:
        return spdlog::level::off;
    default:
        return spdlog::level::debug;
    }
}

}  // namespace AFSM
