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

/**
 * @file AFSM.h
 * @brief Single include for applications using the engine
 */

#include "common/ConfigurationError.h"
#include "common/ExceptionUtils.h"
#include "common/HandlerEscalation.h"
#include "common/Logger.h"
#include "events/FunctionEventHandler.h"
#include "events/IEventHandler.h"
#include "model/Transition.h"
#include "model/TransitionTable.h"
#include "runtime/Controller.h"
#include "runtime/StateMachine.h"
#include "runtime/StateMachineBuilder.h"
