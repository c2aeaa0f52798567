/*
 * Copyright 2023-2025 Playlab/ACAL
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

// Common - Views and error classes
#include "common/Errors.hh"
#include "common/View.hh"

// Memory - Global event log
#include "memory/Event.hh"
#include "memory/Memory.hh"

// Thread - Per-thread state and translation cache
#include "thread/ThreadState.hh"
#include "thread/TranslationCache.hh"

// Effect - Instruction effects and their interpreter
#include "effect/ChoiceOracle.hh"
#include "effect/Effect.hh"
#include "effect/EffectInterpreter.hh"
#include "effect/InstructionState.hh"

// Config - Model parameter management
#include "config/CLIManager.hh"
#include "config/PromSimConfig.hh"
#include "config/SimConfig.hh"
#include "config/SimConfigManager.hh"

// Scenario - Replay of scenario files
#include "scenario/EffectJson.hh"
#include "scenario/Scenario.hh"
#include "scenario/ScenarioTop.hh"

// Utils
#include "utils/HashableType.hh"
#include "utils/Logging.hh"
#include "utils/Overloaded.hh"
