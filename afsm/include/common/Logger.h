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

#pragma once

#include "common/ILoggerBackend.h"
#include <memory>
#include <source_location>
#include <spdlog/fmt/fmt.h>
#include <string>

namespace AFSM {

/**
 * @brief Centralized logging facade with dependency injection support
 *
 * Every component of the engine logs through this facade. Two usage patterns:
 *
 * 1. Default mode: the spdlog backend is created lazily on first use
 * 2. Custom mode: the application injects its own ILoggerBackend implementation
 *
 * Thread-safe: backend installation is mutex protected, message output is delegated
 * to the (thread-safe) backend.
 *
 * Example: Using default logger
 * @code
 * AFSM::Logger::initialize();
 * LOG_INFO("Machine '{}' started", name);
 * @endcode
 *
 * Example: Logging into a file as well
 * @code
 * AFSM::Logger::initialize("/var/log/myservice", true);
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Inject custom logger backend
     *
     * Replaces the current backend. Should be called before machines are started.
     *
     * @param backend User's logger backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Initialize default logger (stdout, no file)
     *
     * Creates the spdlog backend if no backend was injected.
     */
    static void initialize();

    /**
     * @brief Initialize default logger with file output
     *
     * @param logDir Directory for log files
     * @param logToFile Enable file logging
     */
    static void initialize(const std::string &logDir, bool logToFile = true);

    /**
     * @brief Set minimum log level
     *
     * @param level Minimum level to log
     */
    static void setLevel(LogLevel level);

    static void trace(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void debug(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void info(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void warn(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void error(const std::string &message, const std::source_location &loc = std::source_location::current());

    /**
     * @brief Flush log buffers
     */
    static void flush();

    // Exposed for tests
    static std::string extractCleanFunctionName(const std::source_location &loc);

private:
    static std::shared_ptr<ILoggerBackend> backend_;
    static std::shared_ptr<ILoggerBackend> ensureBackend();
    static void write(LogLevel level, const std::string &message, const std::source_location &loc);
};

}  // namespace AFSM

// Format with the fmt library shipped alongside spdlog so that source_location is captured at the call site
#define LOG_TRACE(...) AFSM::Logger::trace(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) AFSM::Logger::debug(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...) AFSM::Logger::info(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...) AFSM::Logger::warn(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) AFSM::Logger::error(fmt::format(__VA_ARGS__), std::source_location::current())
