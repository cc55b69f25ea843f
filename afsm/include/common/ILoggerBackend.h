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

#include <source_location>
#include <string>

namespace AFSM {

/**
 * @brief Log level enumeration
 *
 * Matches the spdlog level set one to one.
 */
enum class LogLevel { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Critical = 5, Off = 6 };

/**
 * @brief Logger backend interface for dependency injection
 *
 * Applications embedding AFSM can route machine diagnostics (transitions, dropped events,
 * handler failures) into their own logging system by implementing this interface.
 *
 * Example: forwarding to an application logger
 * @code
 * class AppLogger : public AFSM::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string &message,
 *              const std::source_location &loc) override {
 *         appLog_->write(static_cast<int>(level), message, loc.file_name(), loc.line());
 *     }
 *
 *     void setLevel(LogLevel level) override {
 *         appLog_->setMinLevel(static_cast<int>(level));
 *     }
 *
 *     void flush() override {
 *         appLog_->flush();
 *     }
 * };
 *
 * AFSM::Logger::setBackend(std::make_unique<AppLogger>());
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @brief Log a message with source location
     *
     * @param level Log level
     * @param message Pre-formatted message (function name already included)
     * @param loc Source location (file, line, function)
     */
    virtual void log(LogLevel level, const std::string &message, const std::source_location &loc) = 0;

    /**
     * @brief Set minimum log level
     *
     * Messages below this level should be ignored.
     */
    virtual void setLevel(LogLevel level) = 0;

    /**
     * @brief Flush log buffers
     */
    virtual void flush() = 0;
};

}  // namespace AFSM
