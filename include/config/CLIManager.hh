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
 * @file CLIManager.hh
 * @brief Command-line front end over SimConfigManager, built on CLI11
 *
 * **Configuration priority (highest to lowest):**
 * ```
 * 1. Command-line options    --pa-bits 40
 * 2. JSON config files       --config model.json
 * 3. Defaults in code        addParameter("pa_bits", 48, ...)
 * ```
 *
 * **Initialization flow of a tool:**
 * ```cpp
 * registerConfigs();                 // addConfig("promsim", new PromSimConfig())
 * registerPromSimCLIArguments();     // --config, --quiet
 * registerCLIArguments();            // tool options
 * parseCLIArguments(argc, argv);
 * parseConfigFiles(configFilePathsFromCLI);
 * setCLIParametersToSimConfig();     // CLI overrides JSON
 * ```
 *
 * @see SimConfigManager, https://github.com/CLIUtils/CLI11
 */

#pragma once

#include <functional>
#include <string>
#include <vector>

#include "config/SimConfig.hh"
#include "config/SimConfigManager.hh"

// Third-Party Library
#include <CLI/CLI.hpp>

namespace promsim {

/**
 * @class CLIManager
 * @brief Maps command-line options onto SimConfig parameters
 *
 * Option values are captured while parsing and only applied by
 * setCLIParametersToSimConfig(), so they win over config files loaded in
 * between.
 */
class CLIManager : public SimConfigManager {
	/** @brief Deferred update of one parameter from the command line */
	struct CLIParameter {
		std::string           configName;
		std::string           paramName;
		std::function<void()> updateFunc;
	};

public:
	/**
	 * @param _name             Tool name, shown in --help
	 * @param _configFilePaths  Config files loaded before those given with --config
	 */
	CLIManager(const std::string& _name, const std::vector<std::string>& _configFilePaths = {})
	    : SimConfigManager("SimConfigManager"), configFilePaths(_configFilePaths), app(_name) {}

	virtual ~CLIManager() = default;

	bool isQuiet() const { return this->quiet; }

protected:
	/** @brief Options every PromSim tool understands: --config, --quiet */
	void registerPromSimCLIArguments();

	/** @brief Hook for tool-specific options */
	virtual void registerCLIArguments() {}

	/**
	 * @brief Parse argv; prints help or the parse error and exits on failure
	 */
	void parseCLIArguments(int argc, char** argv) {
		argv = this->app.ensure_utf8(argv);
		try {
			this->app.parse(argc, argv);
		} catch (const CLI::ParseError& e) { exit(this->app.exit(e)); }
	}

	/**
	 * @brief Option taking a value for a config parameter (or one struct member)
	 *
	 * ```cpp
	 * addCLIOption<int>("--pa-bits", "Physical address width", "promsim", "pa_bits");
	 * addCLIOption<uint32_t, TranslationParams>("--levels", "Page-table levels", "promsim", "translation", "levels");
	 * ```
	 *
	 * @param _defaultValue Show the current parameter value in --help
	 */
	template <typename T, typename TStruct = void>
	inline CLI::Option* addCLIOption(const std::string& _optionName, const std::string& _optionDescription,
	                                 const std::string& _configName, const std::string& _paramName,
	                                 const std::string& _memberName = "", const bool& _defaultValue = true);

	/**
	 * @brief Value-less flag setting a BOOL parameter to `_value`
	 */
	inline CLI::Option* addCLIFlag(const std::string& _optionName, const std::string& _optionDescription,
	                               const std::string& _configName, const std::string& _paramName, bool _value = true);

	/** @brief Apply the captured option values; call after parseConfigFiles() */
	void setCLIParametersToSimConfig();

	CLI::App* getCLIApp() const { return const_cast<CLI::App*>(&app); }

	std::vector<std::string> configFilePaths = {};

	std::vector<std::string> configFilePathsFromCLI = {};

	bool quiet = false;

private:
	void addCLIParameter(const std::string& _configName, const std::string& _paramName,
	                     std::function<void()> _updateFunc);

	std::vector<CLIParameter> cliParameters;

	CLI::App app;
};

}  // end of namespace promsim

#include "config/CLIManager.inl"
