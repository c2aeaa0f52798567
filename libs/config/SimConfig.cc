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
 * @file SimConfig.cc
 * @brief JSON decoding of SimConfig parameters
 *
 * | ParamType      | JSON type    | C++ type       | Example                    |
 * |----------------|--------------|----------------|----------------------------|
 * | INT            | number (int) | int            | "pa_bits": 48              |
 * | FLOAT          | number       | float          | "ratio": 0.5               |
 * | STRING         | string       | std::string    | "name": "litmus"           |
 * | BOOL           | boolean      | bool           | "trace_effects": true      |
 * | USER_DEFINED   | any          | custom         | "translation": {...}       |
 */

#include "config/SimConfig.hh"

namespace promsim {

void SimConfig::parseParameters(const json& _params) {
	for (const auto& [param_name, param_value] : _params.items()) {
		if (!this->parameters.contains(param_name)) {
			LABELED_WARNING(this->name) << "The parameter \'" << param_name << "\' is not defined in \'" << this->name
			                            << "\'. It will be skipped during the config file parsing.";
			continue;
		}

		switch (this->parameters.at(param_name)->getType()) {
			case ParamType::INT: {
				auto i = param_value.get<int>();
				this->setParameter<int>(param_name, i);
				VERBOSE_LABELED_INFO(this->name) << param_name + " set to " << i;
				break;
			}
			case ParamType::FLOAT: {
				auto f = param_value.get<float>();
				this->setParameter<float>(param_name, f);
				VERBOSE_LABELED_INFO(this->name) << param_name + " set to " << f;
				break;
			}
			case ParamType::STRING: {
				auto s = param_value.get<std::string>();
				this->setParameter<std::string>(param_name, s);
				VERBOSE_LABELED_INFO(this->name) << param_name + " set to " + s;
				break;
			}
			case ParamType::BOOL: {
				auto b = param_value.get<bool>();
				this->setParameter<bool>(param_name, b);
				VERBOSE_LABELED_INFO(this->name) << param_name + " set to " << (b ? "true" : "false");
				break;
			}
			case ParamType::USER_DEFINED: {
				this->parseParametersUserDefined(param_name, param_value);
				break;
			}
			default: LABELED_ERROR(this->name) << "Undefined ParamType !"; break;
		}
	}
}

void SimConfig::updateParameter(const std::string& _name, ParameterBase* _param) {
	auto iter = this->parameters.find(_name);
	LABELED_ASSERT_MSG(iter != this->parameters.end(), this->name, "The parameter \'" + _name + "\' does not exist.");
	delete iter->second;
	this->parameters.at(_name) = _param;
}

}  // namespace promsim
