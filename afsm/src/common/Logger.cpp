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

#include "common/Logger.h"
#include "backends/SpdlogBackend.h"

#include <cctype>
#include <mutex>

namespace AFSM {

std::shared_ptr<ILoggerBackend> Logger::backend_;

// Guards backend_ replacement; logging itself works on a snapshot of the pointer
static std::mutex backend_mutex;

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    backend_ = std::move(backend);
}

void Logger::initialize() {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_shared<SpdlogBackend>();
    }
}

void Logger::initialize(const std::string &logDir, bool logToFile) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_shared<SpdlogBackend>(logDir, logToFile);
    }
}

void Logger::setLevel(LogLevel level) {
    ensureBackend()->setLevel(level);
}

void Logger::trace(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Trace, message, loc);
}

void Logger::debug(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Debug, message, loc);
}

void Logger::info(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Info, message, loc);
}

void Logger::warn(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Warn, message, loc);
}

void Logger::error(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Error, message, loc);
}

void Logger::flush() {
    ensureBackend()->flush();
}

void Logger::write(LogLevel level, const std::string &message, const std::source_location &loc) {
    auto backend = ensureBackend();
    std::string enhanced_message = extractCleanFunctionName(loc) + "() - " + message;
    backend->log(level, enhanced_message, loc);
}

std::shared_ptr<ILoggerBackend> Logger::ensureBackend() {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_shared<SpdlogBackend>();
    }
    return backend_;
}

std::string Logger::extractCleanFunctionName(const std::source_location &loc) {
    std::string full_name = loc.function_name();

    size_t paren_pos = full_name.find('(');
    if (paren_pos == std::string::npos) {
        return "UnknownFunction";
    }

    size_t name_end = paren_pos;
    while (name_end > 0 &&
           (std::isspace(static_cast<unsigned char>(full_name[name_end - 1])) || full_name[name_end - 1] == ')')) {
        name_end--;
    }

    // Last space outside template/parameter brackets separates the return type from the name
    size_t name_start = 0;
    size_t space_pos = std::string::npos;
    int angle_bracket_count = 0;
    int paren_count = 0;
    for (size_t i = 0; i < name_end; i++) {
        char c = full_name[i];
        if (c == '<') {
            angle_bracket_count++;
        } else if (c == '>') {
            angle_bracket_count--;
        } else if (c == '(') {
            paren_count++;
        } else if (c == ')') {
            paren_count--;
        } else if (c == ' ' && angle_bracket_count == 0 && paren_count == 0) {
            space_pos = i;
        }
    }

    if (space_pos != std::string::npos) {
        name_start = space_pos + 1;
    }

    std::string qualified_name = full_name.substr(name_start, name_end - name_start);

    while (!qualified_name.empty() && (std::isspace(static_cast<unsigned char>(qualified_name[0])) ||
                                       qualified_name[0] == '*' || qualified_name[0] == '&')) {
        qualified_name = qualified_name.substr(1);
    }

    // Machines are templates: strip every template argument list so log lines stay short
    std::string result;
    int angle_count = 0;
    for (char c : qualified_name) {
        if (c == '<') {
            angle_count++;
        } else if (c == '>') {
            angle_count--;
        } else if (angle_count == 0) {
            result += c;
        }
    }

    while (!result.empty() && std::isspace(static_cast<unsigned char>(result.back()))) {
        result.pop_back();
    }

    return result.empty() ? "UnknownFunction" : result;
}

}  // namespace AFSM
