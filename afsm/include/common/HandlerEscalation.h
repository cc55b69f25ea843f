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

#include <exception>
#include <stdexcept>
#include <string>

namespace AFSM {

/**
 * @brief Thrown by a handler that is asked to take a failure path it never declared
 *
 * FunctionEventHandler has no error or exception behaviour of its own; reaching either
 * one is a programming error in the machine's configuration. When escalating from an
 * exception callback the original failure is kept as cause().
 */
class HandlerEscalation : public std::runtime_error {
public:
    explicit HandlerEscalation(const std::string &message, std::exception_ptr cause = nullptr);

    std::exception_ptr cause() const noexcept {
        return cause_;
    }

    /**
     * @brief Message of the original failure, or an empty string without one
     */
    std::string causeMessage() const;

private:
    std::exception_ptr cause_;
};

}  // namespace AFSM
