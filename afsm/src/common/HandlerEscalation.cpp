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

#include "common/HandlerEscalation.h"
#include "common/ExceptionUtils.h"

namespace AFSM {

HandlerEscalation::HandlerEscalation(const std::string &message, std::exception_ptr cause)
    : std::runtime_error(message), cause_(std::move(cause)) {}

std::string HandlerEscalation::causeMessage() const {
    if (!cause_) {
        return "";
    }
    return describeException(cause_);
}

}  // namespace AFSM
