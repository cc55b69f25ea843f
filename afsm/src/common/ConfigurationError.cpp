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

#include "common/ConfigurationError.h"

namespace AFSM {

ConfigurationError::ConfigurationError(Reason reason, const std::string &machineName)
    : std::logic_error(std::string(reasonToString(reason)) + " for state machine '" + machineName + "'"),
      reason_(reason), machineName_(machineName) {}

const char *ConfigurationError::reasonToString(Reason reason) {
    switch (reason) {
    case Reason::EmptyTransitionTable:
        return "No transitions found";
    case Reason::MissingFinishTransition:
        return "No finish transition found";
    }
    return "Invalid configuration";
}

}  // namespace AFSM
