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

#include "config/SimConfigManager.hh"

#include <algorithm>
#include <filesystem>
#include <fstream>

#include "config/SimConfig.hh"

// Third-Party Library
#include <nlohmann/json.hpp>

namespace promsim {

void SimConfigManager::addConfig(const std::string& name, SimConfig* config) {
	CLASS_ASSERT_MSG(!this->configs.contains(name),
	                 "SimConfig `" + name + "` is already registered in SimConfigManager.");
	VERBOSE_CLASS_INFO << "Adding SimConfig: " << name;
	this->configs.emplace(name, config);
}

void SimConfigManager::parseConfigJson(const json& _j, const std::string& _source) {
	LABELED_ASSERT_MSG(_j.is_object(), this->name, "Config " << _source << " is not a JSON object.");

	for (const auto& [key, params] : _j.items()) {
		if (auto iter = this->configs.find(key); iter != this->configs.end()) {
			iter->second->parseParameters(params);
		} else {
			LABELED_WARNING(this->name) << "Unrecognized configuration key: \'" << key << "\' found in " << _source
			                            << ". It is not registered in " << this->name << ".";
		}
	}
}

void SimConfigManager::parseConfigFiles(const std::vector<std::string>& _configFilePaths) {
	for (const auto& path : _configFilePaths) {
		if (path.empty()) continue;

		LABELED_ASSERT_MSG(std::filesystem::exists(path), this->name, "File " << path << " does not exist.");

		std::fstream f(path);
		LABELED_ASSERT_MSG(f.is_open(), this->name, "Error opening file: " << path);

		json j;
		try {
			j = json::parse(f);
		} catch (const json::parse_error& e) {
			LABELED_ERROR(this->name) << "JSON parsing error: " << e.what() << " in file " << path;
		}

		for (const auto& [key, params] : j.items()) {
			bool seen = std::find(this->processedKeys.begin(), this->processedKeys.end(), key) !=
			            this->processedKeys.end();
			LABELED_ASSERT_MSG(!seen, this->name, "Duplicate key found: '" << key << "' in file " << path << ".");
			this->processedKeys.push_back(key);
		}

		this->parseConfigJson(j, path);
	}
}

SimConfig* SimConfigManager::getConfig(const std::string& _configName) const {
	auto iter = this->configs.find(_configName);
	CLASS_ASSERT_MSG(iter != this->configs.end(), "The config \'" + _configName + "\' does not exist.");
	return iter->second;
}

}  // namespace promsim
