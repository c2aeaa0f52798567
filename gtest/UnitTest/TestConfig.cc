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
 * @file TestConfig.cc
 * @brief Unit tests for PromSimConfig and SimConfigManager
 *
 * Covers default values, JSON overrides (including the USER_DEFINED
 * `translation` struct), struct member access, ModelParams validation and
 * JSON config-file loading.
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "PromSim.hh"

using namespace promsim;

namespace {

class TestConfigManager : public SimConfigManager {
public:
	TestConfigManager() : SimConfigManager("TestConfigManager") { this->addConfig("promsim", new PromSimConfig()); }

	using SimConfigManager::parseConfigFiles;

	ModelParams getModelParams() const {
		return dynamic_cast<PromSimConfig*>(this->getConfig("promsim"))->getModelParams();
	}
};

class WidthConfig : public SimConfig {
public:
	WidthConfig() : SimConfig("width") {}

	template <typename T>
	void declare(const std::string& _name, const T& _value, ParamType _type) {
		this->addParameter<T>(_name, _value, _type);
	}
};

std::string writeConfigFile(const std::string& _name, const json& _content) {
	auto path = std::filesystem::temp_directory_path() / _name;
	std::ofstream(path) << _content.dump();
	return path.string();
}

}  // namespace

TEST(PromSimConfigTest, Defaults) {
	PromSimConfig config;
	ModelParams   params = config.getModelParams();

	EXPECT_EQ(config.getName(), "promsim");
	EXPECT_EQ(params.paBits, 48u);
	EXPECT_EQ(params.maxPendingPromises, 0u);
	EXPECT_TRUE(params.enableForwarding);
	EXPECT_FALSE(params.traceEffects);
	EXPECT_EQ(params.translation.levels, 4u);
	EXPECT_EQ(params.translation.granuleBits, 12u);
	EXPECT_EQ(params.translation.vaBits, 48u);
}

TEST(PromSimConfigTest, JsonOverridesKeepUnsetMembers) {
	PromSimConfig config;
	config.parseParameters(json{{"pa_bits", 40},
	                            {"trace_effects", true},
	                            {"translation", {{"levels", 3}, {"granule_bits", 16}}},
	                            {"unknown", 1}});

	ModelParams params = config.getModelParams();
	EXPECT_EQ(params.paBits, 40u);
	EXPECT_TRUE(params.traceEffects);
	EXPECT_EQ(params.translation.levels, 3u);
	EXPECT_EQ(params.translation.granuleBits, 16u);
	EXPECT_EQ(params.translation.vaBits, 48u);

	json dumped = params.translation;
	EXPECT_EQ(dumped, (json{{"levels", 3}, {"granule_bits", 16}, {"va_bits", 48}}));
}

TEST(PromSimConfigTest, StructMemberAccess) {
	PromSimConfig config;
	EXPECT_EQ((config.getParameterMemberData<TranslationParams, uint32_t>("translation", "granuleBits")), 12u);

	config.setParameterMemberData<TranslationParams, uint32_t>("translation", "vaBits", 39);
	EXPECT_EQ(config.getParameter<TranslationParams>("translation").vaBits, 39u);

	EXPECT_THROW((config.getParameterMemberData<TranslationParams, uint32_t>("translation", "depth")),
	             std::runtime_error);
	EXPECT_THROW(config.getParameter<bool>("pa_bits"), std::runtime_error);
	EXPECT_THROW(config.getParameter<int>("va_bits"), std::runtime_error);
}

TEST(PromSimConfigTest, InvalidValuesAreRejected) {
	PromSimConfig config;
	EXPECT_THROW(config.parseParameters(json{{"pa_bits", "wide"}}), json::type_error);

	config.setParameter<int>("pa_bits", 65);
	EXPECT_THROW(config.getModelParams(), std::runtime_error);

	config.setParameter<int>("pa_bits", 32);
	config.setParameter<int>("max_pending_promises", -1);
	EXPECT_THROW(config.getModelParams(), std::runtime_error);
}

TEST(SimConfigTest, RegistrationTypeMustMatchParamType) {
	WidthConfig config;
	EXPECT_THROW(config.declare<uint32_t>("pa_bits", 48u, ParamType::INT), std::runtime_error);
	EXPECT_THROW(config.declare<double>("ratio", 0.5, ParamType::FLOAT), std::runtime_error);
	EXPECT_THROW(config.getParameter<uint32_t>("pa_bits"), std::runtime_error);

	config.declare<int>("pa_bits", 48, ParamType::INT);
	config.declare<TranslationParams>("translation", TranslationParams(), ParamType::USER_DEFINED);
	config.parseParameters(json{{"pa_bits", 40}});
	EXPECT_EQ(config.getParameter<int>("pa_bits"), 40);
	EXPECT_THROW(config.getParameter<uint32_t>("pa_bits"), std::runtime_error);
}

TEST(SimConfigManagerTest, ParseConfigJson) {
	TestConfigManager manager;
	manager.parseConfigJson(json{{"promsim", {{"max_pending_promises", 2}, {"enable_forwarding", false}}},
	                             {"other", {{"x", 1}}}});

	ModelParams params = manager.getModelParams();
	EXPECT_EQ(params.maxPendingPromises, 2u);
	EXPECT_FALSE(params.enableForwarding);
	EXPECT_EQ(manager.getParameter<int>("promsim", "max_pending_promises"), 2);

	EXPECT_THROW(manager.parseConfigJson(json::array()), std::runtime_error);
	EXPECT_THROW(manager.getParameter<int>("missing", "pa_bits"), std::runtime_error);
}

TEST(SimConfigManagerTest, ParseConfigFiles) {
	auto first  = writeConfigFile("promsim_config_a.json", json{{"promsim", {{"pa_bits", 36}}}});
	auto second = writeConfigFile("promsim_config_b.json", json{{"promsim", {{"pa_bits", 40}}}});

	TestConfigManager manager;
	manager.parseConfigFiles({first, ""});
	EXPECT_EQ(manager.getModelParams().paBits, 36u);

	// The same top-level key may only come from one file.
	EXPECT_THROW(manager.parseConfigFiles({second}), std::runtime_error);

	TestConfigManager other;
	EXPECT_THROW(other.parseConfigFiles({"/nonexistent/promsim.json"}), std::runtime_error);

	std::filesystem::remove(first);
	std::filesystem::remove(second);
}
