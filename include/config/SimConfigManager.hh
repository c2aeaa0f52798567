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
 * @file SimConfigManager.hh
 * @brief Registry of named SimConfig objects loaded from JSON files
 *
 * **Configuration workflow:**
 * ```
 * 1. registerConfigs():   addConfig("promsim", new PromSimConfig());
 * 2. parseConfigFiles():  { "promsim": { "pa_bits": 40 } }
 * 3. access:              getParameter<int>("promsim", "pa_bits")         // 40
 * 4. update:              updateParameter<int>("promsim", "pa_bits", "", 44)
 * ```
 *
 * Every top-level key of a config file names a registered SimConfig; unknown
 * keys are reported and skipped, and a key repeated across files is an error.
 */

#pragma once

#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "config/SimConfig.hh"
#include "utils/HashableType.hh"
#include "utils/Logging.hh"

namespace promsim {

/**
 * @class SimConfigManager
 * @brief Owns a set of SimConfig objects and routes JSON and CLI values to them
 *
 * @see SimConfig, CLIManager
 */
class SimConfigManager : virtual public HashableType {
	friend class SimConfig;

public:
	SimConfigManager(const std::string& _name) : name(_name) {}

	~SimConfigManager() {
		for (auto& it : configs) {
			VERBOSE_CLASS_INFO << "Deleting SimConfig object : " << it.first;
			delete it.second;
		}
	}

	/**
	 * @brief Value of parameter `_paramName` of config `_configName`
	 * @throws std::runtime_error if either is missing or T does not match
	 */
	template <typename T>
	T getParameter(const std::string& _configName, const std::string& _paramName) const {
		return this->getConfig(_configName)->getParameter<T>(_paramName);
	}

	/**
	 * @brief One member of a struct parameter
	 *
	 * ```cpp
	 * uint32_t levels = getParameterMemberData<TranslationParams, uint32_t>("promsim", "translation", "levels");
	 * ```
	 */
	template <typename T_Struct, typename T_Member>
	T_Member getParameterMemberData(const std::string& _configName, const std::string& _paramName,
	                                const std::string& _memberData) const {
		return this->getConfig(_configName)->getParameterMemberData<T_Struct, T_Member>(_paramName, _memberData);
	}

	/**
	 * @brief Route each top-level key of `_j` to the SimConfig of that name
	 */
	void parseConfigJson(const json& _j, const std::string& _source = "<json>");

protected:
	/** @brief Hook for subclasses to addConfig() their configurations */
	virtual void registerConfigs() {}

	/** @brief Register `_config` under `_name`; the manager takes ownership */
	void addConfig(const std::string& _name, SimConfig* _config);

	/**
	 * @brief Load JSON config files in order
	 * @throws std::runtime_error on a missing file, invalid JSON or a key repeated across files
	 */
	void parseConfigFiles(const std::vector<std::string>& _configFilePaths);

	/**
	 * @brief Set a parameter, or one member of it when TStruct is given
	 *
	 * ```cpp
	 * updateParameter<int>("promsim", "pa_bits", "", 40);
	 * updateParameter<uint32_t, TranslationParams>("promsim", "translation", "levels", 3);
	 * ```
	 */
	template <typename T, typename TStruct = void>
	void updateParameter(const std::string& _configName, const std::string& _paramName, const std::string& _member_name,
	                     const T& _value) {
		if constexpr (std::is_same_v<TStruct, void>) {
			this->getConfig(_configName)->setParameter<T>(_paramName, _value);
			VERBOSE_CLASS_INFO << "Parameter \'" + _paramName + "\' is updated";
		} else {
			this->getConfig(_configName)->setParameterMemberData<TStruct, T>(_paramName, _member_name, _value);
			VERBOSE_CLASS_INFO << "Parameter \'" + _paramName + "." + _member_name + "\' is updated";
		}
	}

	/** @throws std::runtime_error if no config is registered under `_configName` */
	SimConfig* getConfig(const std::string& _configName) const;

private:
	std::unordered_map<std::string, SimConfig*> configs;

	// Top-level keys already loaded by parseConfigFiles()
	std::vector<std::string> processedKeys;

	const std::string name;
};

}  // end of namespace promsim
