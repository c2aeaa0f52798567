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

#include "config/CLIManager.hh"

namespace promsim {

void CLIManager::setCLIParametersToSimConfig() {
	for (auto cli_param : this->cliParameters) { cli_param.updateFunc(); }
}

void CLIManager::addCLIParameter(const std::string& _configName, const std::string& _paramName,
                                 std::function<void()> _updateFunc) {
	auto cli_param = CLIParameter{_configName, _paramName, _updateFunc};
	this->cliParameters.push_back(cli_param);
}

void CLIManager::registerPromSimCLIArguments() {
	this->getCLIApp()
	    ->add_option("-c,--config", this->configFilePathsFromCLI, "Specifies the path(s) to configuration file(s).")
	    ->expected(0, -1);
	this->getCLIApp()
	    ->add_flag("-q,--quiet", this->quiet, "Suppress informational log output.")
	    ->default_val(this->quiet);
}

}  // namespace promsim
