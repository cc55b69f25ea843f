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
#include <optional>
#include <spdlog/spdlog.h>
#include <string>

namespace AFSM {

/**
 * @brief spdlog-based logger backend (default)
 *
 * Console output through a colored stdout sink, optionally mirrored into
 * <logDir>/afsm.log. The initial level comes from the SPDLOG_LEVEL environment
 * variable when set, debug otherwise.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    SpdlogBackend(const std::string &logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string &message, const std::source_location &loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

    /**
     * @brief Parse a level name as accepted in SPDLOG_LEVEL
     * @return Parsed level, or nullopt for unknown names
     */
    static std::optional<LogLevel> parseLevel(const std::string &name);

private:
    std::shared_ptr<spdlog::logger> logger_;

    spdlog::level::level_enum convertLevel(LogLevel level);
};

}  // namespace AFSM
