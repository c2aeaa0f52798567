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

#include "scenario/ScenarioTop.hh"

#include <iostream>

#include "config/PromSimConfig.hh"
#include "utils/Logging.hh"

namespace promsim {

void ScenarioTop::registerConfigs() { this->addConfig("promsim", new PromSimConfig()); }

void ScenarioTop::registerCLIArguments() {
	this->getCLIApp()->add_option("-s,--scenario", this->scenarioPath, "Scenario file to replay.")->required();

	this->addCLIOption<int>("--pa-bits", "Physical address width in bits.", "promsim", "pa_bits");
	this->addCLIOption<int>("--max-promises", "Pending promises allowed per thread (0 = unlimited).", "promsim",
	                        "max_pending_promises");
	this->addCLIOption<uint32_t, TranslationParams>("--levels", "Page-table levels.", "promsim", "translation",
	                                                "levels");
	this->addCLIFlag("--trace", "Log every effect and its result.", "promsim", "trace_effects");
	this->addCLIFlag("--no-forwarding", "Disable store forwarding.", "promsim", "enable_forwarding", false);
}

void ScenarioTop::init(int argc, char** argv) {
	this->registerConfigs();
	this->registerPromSimCLIArguments();
	this->registerCLIArguments();
	this->parseCLIArguments(argc, argv);

	LogOStream::setQuiet(this->quiet);

	std::vector<std::string> paths = this->configFilePaths;
	paths.insert(paths.end(), this->configFilePathsFromCLI.begin(), this->configFilePathsFromCLI.end());
	this->parseConfigFiles(paths);
	this->setCLIParametersToSimConfig();
}

ModelParams ScenarioTop::getModelParams() const {
	auto config = dynamic_cast<PromSimConfig*>(this->getConfig("promsim"));
	CLASS_ASSERT_MSG(config, "The config 'promsim' is not a PromSimConfig.");
	return config->getModelParams();
}

ScenarioOutcome ScenarioTop::run() const {
	ModelParams params = this->getModelParams();
	VERBOSE_CLASS_INFO << "pa_bits=" << params.paBits << " max_pending_promises=" << params.maxPendingPromises
	                   << " levels=" << params.translation.levels;

	try {
		return ScenarioRunner(params).run(Scenario::fromFile(this->scenarioPath));
	} catch (const PromSimError& e) {
		ScenarioOutcome outcome;
		outcome.status    = ScenarioStatus::FAILED;
		outcome.errorKind = e.getKind();
		outcome.message   = e.what();
		return outcome;
	}
}

int ScenarioTop::finish(const ScenarioOutcome& _outcome) const {
	std::cout << _outcome.toJson().dump(2) << std::endl;
	switch (_outcome.status) {
		case ScenarioStatus::COMPLETED: return 0;
		case ScenarioStatus::DISCARDED: return 1;
		default: return 2;
	}
}

}  // namespace promsim
