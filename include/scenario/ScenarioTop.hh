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
 * @file ScenarioTop.hh
 * @brief Top-level object of the `promsim` scenario replay tool
 *
 * ```
 * promsim --scenario mp.json [--config model.json] [--pa-bits 40] [--max-promises 2]
 *         [--levels 3] [--trace] [--no-forwarding] [--quiet]
 * ```
 *
 * The outcome is printed to stdout as JSON. The exit code is 0 for a completed
 * run, 1 for a discarded one and 2 for a failure.
 */

#pragma once

#include <string>
#include <vector>

#include "config/CLIManager.hh"
#include "effect/EffectInterpreter.hh"
#include "scenario/Scenario.hh"

namespace promsim {

class ScenarioTop : public CLIManager {
public:
	ScenarioTop(const std::string& _name = "promsim", const std::vector<std::string>& _configFilePaths = {})
	    : CLIManager(_name, _configFilePaths) {}

	/** @brief Register configs and options, parse argv and config files */
	void init(int argc, char** argv);

	/** @brief Load and replay the scenario given with --scenario */
	ScenarioOutcome run() const;

	/** @brief Print `_outcome` and map it to the process exit code */
	int finish(const ScenarioOutcome& _outcome) const;

	ModelParams getModelParams() const;

	const std::string& getScenarioPath() const { return this->scenarioPath; }

protected:
	void registerConfigs() override;

	void registerCLIArguments() override;

private:
	std::string scenarioPath;
};

}  // namespace promsim
