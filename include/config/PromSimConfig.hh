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
 * @file PromSimConfig.hh
 * @brief The model's SimConfig ("promsim")
 *
 * | Parameter              | Type                       | Default       |
 * |------------------------|----------------------------|---------------|
 * | pa_bits                | INT                        | 48            |
 * | max_pending_promises   | INT (0 = unlimited)        | 0             |
 * | enable_forwarding      | BOOL                       | true          |
 * | trace_effects          | BOOL                       | false         |
 * | translation            | USER_DEFINED               | 4 / 12 / 48   |
 *
 * ```json
 * {
 *   "promsim": {
 *     "pa_bits": 40,
 *     "translation": { "levels": 3, "granule_bits": 16, "va_bits": 42 }
 *   }
 * }
 * ```
 */

#pragma once

#include <cstdint>
#include <string>

#include "config/SimConfig.hh"
#include "effect/EffectInterpreter.hh"
#include "thread/TranslationCache.hh"

// Third-Party Library
#include <nlohmann/json.hpp>

namespace promsim {

SPECIALIZE_PARAMETER(TranslationParams, uint32_t, MAKE_MEMBER_PAIR(TranslationParams, levels),
                     MAKE_MEMBER_PAIR(TranslationParams, granuleBits), MAKE_MEMBER_PAIR(TranslationParams, vaBits))

/** @brief Missing keys keep their current value */
void from_json(const json& _j, TranslationParams& _params);

void to_json(json& _j, const TranslationParams& _params);

class PromSimConfig : public SimConfig {
public:
	PromSimConfig(const std::string& name = "promsim") : SimConfig(name) {
		this->addParameter<int>("pa_bits", 48, ParamType::INT);
		this->addParameter<int>("max_pending_promises", 0, ParamType::INT);
		this->addParameter<bool>("enable_forwarding", true, ParamType::BOOL);
		this->addParameter<bool>("trace_effects", false, ParamType::BOOL);
		this->addParameter<TranslationParams>("translation", TranslationParams(), ParamType::USER_DEFINED);
	}

	~PromSimConfig() = default;

	/**
	 * @brief Model parameters for the EffectInterpreter
	 * @throws std::runtime_error if a value is out of range
	 */
	ModelParams getModelParams() const;

protected:
	void parseParametersUserDefined(const std::string& _param_name, const json& _param_value) override;
};

}  // namespace promsim
