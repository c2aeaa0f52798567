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

/**
 * @file EffectJson.hh
 * @brief JSON decoding of effects and events for scenario files
 *
 * @details
 * Each effect is an object with a `"kind"` and the effect's fields, all of them
 * optional except the address or register. Numbers may be JSON integers or
 * `"0x..."` strings. A `deps` field is either `"all"` (the default) or
 * `{"registers": [...], "reads": [...]}`.
 *
 * @code{.json}
 * { "kind": "MemRead",  "pa": "0x1000", "strength": "acquire", "exclusive": true }
 * { "kind": "MemWrite", "pa": "0x1000", "value": 1, "data_deps": {"registers": ["x1"]} }
 * { "kind": "Barrier",  "type": "dmb", "scope": "st" }
 * { "kind": "Tlbi",     "scope": "by_va_by_asid", "va": "0x400000", "asid": 1 }
 * { "kind": "write",    "tid": 0, "location": "0x1000", "value": 5 }      // event
 * @endcode
 *
 * Malformed input raises StructuralError.
 */

#pragma once

#include <cstdint>
#include <string>

#include "effect/Effect.hh"
#include "memory/Event.hh"

// Third-Party Library
#include <nlohmann/json.hpp>

namespace promsim {

NLOHMANN_JSON_SERIALIZE_ENUM(RegisterClass, {{RegisterClass::APPLICATION, "application"},
                                             {RegisterClass::SYSTEM, "system"}})

NLOHMANN_JSON_SERIALIZE_ENUM(AccessStrength, {{AccessStrength::PLAIN, "plain"},
                                              {AccessStrength::ACQUIRE_PC, "acquire_pc"},
                                              {AccessStrength::ACQUIRE, "acquire"},
                                              {AccessStrength::RELEASE, "release"}})

NLOHMANN_JSON_SERIALIZE_ENUM(ReadPurpose, {{ReadPurpose::DATA, "data"},
                                           {ReadPurpose::IFETCH, "ifetch"},
                                           {ReadPurpose::TRANSLATION, "translation"}})

NLOHMANN_JSON_SERIALIZE_ENUM(BarrierType, {{BarrierType::DMB, "dmb"}, {BarrierType::DSB, "dsb"}, {BarrierType::ISB, "isb"}})

NLOHMANN_JSON_SERIALIZE_ENUM(BarrierScope, {{BarrierScope::SY, "sy"}, {BarrierScope::LD, "ld"}, {BarrierScope::ST, "st"}})

NLOHMANN_JSON_SERIALIZE_ENUM(Shareability, {{Shareability::NON_SHAREABLE, "non_shareable"},
                                            {Shareability::INNER, "inner"},
                                            {Shareability::OUTER, "outer"},
                                            {Shareability::FULL_SYSTEM, "full_system"}})

NLOHMANN_JSON_SERIALIZE_ENUM(Regime, {{Regime::EL10, "el10"}, {Regime::EL2, "el2"}, {Regime::EL3, "el3"}})

NLOHMANN_JSON_SERIALIZE_ENUM(TlbiScope, {{TlbiScope::ALL, "all"},
                                         {TlbiScope::BY_ASID, "by_asid"},
                                         {TlbiScope::BY_VA_ALL_ASID, "by_va_all_asid"},
                                         {TlbiScope::BY_VA_BY_ASID, "by_va_by_asid"}})

/** @brief Integer or "0x..." / decimal string */
uint64_t parseNumber(const nlohmann::json& _j);

Deps parseDeps(const nlohmann::json& _j);

Effect parseEffect(const nlohmann::json& _j);

/** @brief `{"kind": "write", ...}` or `{"kind": "tlbi", ...}` */
Event parseEvent(const nlohmann::json& _j);

}  // namespace promsim
