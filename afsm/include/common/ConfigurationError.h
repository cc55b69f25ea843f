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

#include <stdexcept>
#include <string>

namespace AFSM {

/**
 * @brief Raised synchronously while building a machine whose transition table can never run
 *
 * Construction is all-or-nothing: when this is thrown no machine object exists.
 */
class ConfigurationError : public std::logic_error {
public:
    enum class Reason {
        EmptyTransitionTable,    // no transition was configured
        MissingFinishTransition  // no transition carries the Finish action
    };

    ConfigurationError(Reason reason, const std::string &machineName);

    Reason reason() const noexcept {
        return reason_;
    }

    const std::string &machineName() const noexcept {
        return machineName_;
    }

    static const char *reasonToString(Reason reason);

private:
    Reason reason_;
    std::string machineName_;
};

}  // namespace AFSM
