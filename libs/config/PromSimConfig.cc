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

#include "config/PromSimConfig.hh"

namespace promsim {

void from_json(const json& _j, TranslationParams& _params) {
	if (_j.contains("levels")) _j.at("levels").get_to(_params.levels);
	if (_j.contains("granule_bits")) _j.at("granule_bits").get_to(_params.granuleBits);
	if (_j.contains("va_bits")) _j.at("va_bits").get_to(_params.vaBits);
}

void to_json(json& _j, const TranslationParams& _params) {
	_j = json{{"levels", _params.levels}, {"granule_bits", _params.granuleBits}, {"va_bits", _params.vaBits}};
}

void PromSimConfig::parseParametersUserDefined(const std::string& _param_name, const json& _param_value) {
	if (_param_name == "translation") {
		auto params = this->getParameter<TranslationParams>(_param_name);
		from_json(_param_value, params);
		this->setParameter<TranslationParams>(_param_name, params);
	} else {
		LABELED_WARNING(this->getName()) << "Undefined ParamType in parseParametersUserDefined() for '" << _param_name
		                                 << "'.";
	}
}

ModelParams PromSimConfig::getModelParams() const {
	int paBits      = this->getParameter<int>("pa_bits");
	int maxPromises = this->getParameter<int>("max_pending_promises");
	LABELED_ASSERT_MSG(paBits > 0 && paBits <= 64, this->getName(), "pa_bits must lie in [1, 64], got " << paBits);
	LABELED_ASSERT_MSG(maxPromises >= 0, this->getName(),
	                   "max_pending_promises must not be negative, got " << maxPromises);

	ModelParams params;
	params.paBits             = static_cast<uint32_t>(paBits);
	params.maxPendingPromises = static_cast<uint32_t>(maxPromises);
	params.enableForwarding   = this->getParameter<bool>("enable_forwarding");
	params.traceEffects       = this->getParameter<bool>("trace_effects");
	params.translation        = this->getParameter<TranslationParams>("translation");
	return params;
}

}  // namespace promsim
