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
 * @file main.cc
 * @brief GoogleTest suite for scenario parsing, replay and the promsim front end
 *
 * @details
 * Scenarios are written inline as JSON so each test shows the litmus shape it
 * replays. ScenarioTopTest drives the same ScenarioTop used by the `promsim`
 * executable with a synthetic argv, a scenario file and a config file.
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "PromSim.hh"

using namespace promsim;

namespace {

class ScenarioTest : public ::testing::Test {
protected:
	void SetUp() override { LogOStream::setQuiet(true); }

	void TearDown() override { LogOStream::setQuiet(false); }

	ScenarioOutcome replay(const std::string& _text, const ModelParams& _params = ModelParams()) {
		return ScenarioRunner(_params).run(Scenario::fromJson(json::parse(_text)));
	}

	static std::string writeFile(const std::string& _name, const std::string& _text) {
		auto path = std::filesystem::temp_directory_path() / _name;
		std::ofstream(path) << _text;
		return path.string();
	}
};

const char* MESSAGE_PASSING = R"({
  "name": "MP+dmb+dmb",
  "memory": { "0x1000": 0, "0x1008": 0 },
  "threads": [
    { "instructions": [
        [ { "kind": "MemWrite", "pa": "0x1000", "value": 1 } ],
        [ { "kind": "Barrier", "type": "dmb", "scope": "sy" } ],
        [ { "kind": "MemWrite", "pa": "0x1008", "value": 1 } ] ] },
    { "instructions": [
        [ { "kind": "MemRead", "pa": "0x1008" } ],
        [ { "kind": "Barrier", "type": "dmb", "scope": "ld" } ],
        [ { "kind": "MemRead", "pa": "0x1000" } ] ] }
  ],
  "schedule": [0, 0, 0, 1, 1, 1],
  "choices": [0]
})";

}  // namespace

/* --------------------------------- replay --------------------------------- */

TEST_F(ScenarioTest, WriteThenRead) {
	ScenarioOutcome outcome = this->replay(R"({
	  "name": "write-read",
	  "memory": { "0x1000": 0 },
	  "threads": [ { "registers": { "x0": 0 }, "instructions": [
	      [ { "kind": "MemWrite", "pa": "0x1000", "value": 5 } ],
	      [ { "kind": "MemRead", "pa": "0x1000" },
	        { "kind": "RegWrite", "reg": "x0", "value": 5, "deps": "all" } ] ] } ]
	})");

	ASSERT_EQ(outcome.status, ScenarioStatus::COMPLETED) << outcome.message;
	EXPECT_EQ(outcome.valueAt(0x1000), 5u);
	ASSERT_EQ(outcome.trace.size(), 2u);
	EXPECT_EQ(outcome.trace[1].effects[0].effect, "MemRead");
	EXPECT_EQ(outcome.trace[1].effects[0].result.value, 5u);
	EXPECT_EQ(outcome.registers[0].at("x0"), 5u);
	EXPECT_TRUE(outcome.promisesFulfilled);
	EXPECT_EQ(outcome.choicesConsumed, 0u);

	json j = outcome.toJson();
	EXPECT_EQ(j["status"], "COMPLETED");
	EXPECT_EQ(j["memory"]["0x1000"], "0x5");
	EXPECT_EQ(j["registers"][0]["x0"], "0x5");
	EXPECT_EQ(j["steps"][1]["effects"][0]["value"], "0x5");
	EXPECT_EQ(j["promises_fulfilled"], true);
}

TEST_F(ScenarioTest, MessagePassingWithBarriers) {
	ScenarioOutcome outcome = this->replay(MESSAGE_PASSING);

	ASSERT_EQ(outcome.status, ScenarioStatus::COMPLETED) << outcome.message;
	ASSERT_EQ(outcome.trace.size(), 6u);
	EXPECT_EQ(outcome.trace[3].effects[0].result.value, 1u);
	EXPECT_EQ(outcome.trace[5].effects[0].result.value, 1u);
	EXPECT_EQ(outcome.trace[5].thread, 1u);
	EXPECT_EQ(outcome.trace[5].instruction, 2u);
	EXPECT_EQ(outcome.choicesConsumed, 1u);
}

TEST_F(ScenarioTest, MessagePassingWithoutReaderBarrier) {
	json scenario = json::parse(MESSAGE_PASSING);
	scenario["threads"][1]["instructions"][1] = json::array();
	scenario["choices"]                      = {0, 1};

	ScenarioOutcome outcome = ScenarioRunner(ModelParams()).run(Scenario::fromJson(scenario));
	ASSERT_EQ(outcome.status, ScenarioStatus::COMPLETED) << outcome.message;
	EXPECT_EQ(outcome.trace[3].effects[0].result.value, 1u);
	EXPECT_EQ(outcome.trace[5].effects[0].result.value, 0u);
	EXPECT_EQ(outcome.choicesConsumed, 2u);
}

TEST_F(ScenarioTest, InterruptedExclusiveIsDiscarded) {
	ScenarioOutcome outcome = this->replay(R"({
	  "memory": { "0x1000": 0 },
	  "threads": [
	    { "instructions": [
	        [ { "kind": "MemRead", "pa": "0x1000", "exclusive": true } ],
	        [ { "kind": "MemWrite", "pa": "0x1000", "value": 1, "exclusive": true } ] ] },
	    { "instructions": [ [ { "kind": "MemWrite", "pa": "0x1000", "value": 7 } ] ] }
	  ],
	  "schedule": [0, 1, 0]
	})");

	EXPECT_EQ(outcome.status, ScenarioStatus::DISCARDED);
	EXPECT_FALSE(outcome.message.empty());
	EXPECT_EQ(outcome.trace.size(), 3u);
	EXPECT_EQ(outcome.valueAt(0x1000), 7u);
}

TEST_F(ScenarioTest, PromisesMustBeFulfilled) {
	const std::string text = R"({
	  "memory": { "0x1008": 0 },
	  "threads": [ { "instructions": [
	      [ { "kind": "MemWrite", "pa": "0x1000", "value": 1 } ],
	      [ { "kind": "MemWrite", "pa": "0x1008", "value": VALUE } ] ] } ],
	  "promises": [ { "before_step": 0, "thread": 0,
	                  "event": { "kind": "write", "tid": 0, "location": "0x1008", "value": 1 } } ]
	})";
	auto withValue = [&](const std::string& _value) {
		std::string s = text;
		s.replace(s.find("VALUE"), 5, _value);
		return s;
	};

	ScenarioOutcome fulfilled = this->replay(withValue("1"));
	ASSERT_EQ(fulfilled.status, ScenarioStatus::COMPLETED) << fulfilled.message;
	EXPECT_TRUE(fulfilled.promisesFulfilled);
	EXPECT_EQ(fulfilled.valueAt(0x1008), 1u);

	ScenarioOutcome broken = this->replay(withValue("2"));
	EXPECT_EQ(broken.status, ScenarioStatus::DISCARDED);
	EXPECT_FALSE(broken.promisesFulfilled);

	ModelParams params;
	params.maxPendingPromises = 1;
	json twoPromises          = json::parse(withValue("1"));
	twoPromises["promises"].push_back(twoPromises["promises"][0]);
	EXPECT_EQ(ScenarioRunner(params).run(Scenario::fromJson(twoPromises)).status, ScenarioStatus::DISCARDED);
}

TEST_F(ScenarioTest, FailuresAreClassified) {
	ScenarioOutcome atomic = this->replay(R"({
	  "threads": [ { "instructions": [ [ { "kind": "MemAtomic", "pa": "0x1000" } ] ] } ]
	})");
	EXPECT_EQ(atomic.status, ScenarioStatus::FAILED);
	EXPECT_EQ(atomic.errorKind, ErrorKind::UNSUPPORTED);
	EXPECT_EQ(atomic.toJson()["error"], "unsupported");

	ScenarioOutcome openWalk = this->replay(R"({
	  "threads": [ { "instructions": [ [ { "kind": "TranslationStart", "va": "0x403000" } ] ] } ]
	})");
	EXPECT_EQ(openWalk.status, ScenarioStatus::FAILED);
	EXPECT_EQ(openWalk.errorKind, ErrorKind::STRUCTURAL);

	ScenarioOutcome overrun = this->replay(R"({
	  "threads": [ { "instructions": [ [ { "kind": "Terminate" } ] ] } ],
	  "schedule": [0, 0]
	})");
	EXPECT_EQ(overrun.status, ScenarioStatus::FAILED);
	EXPECT_EQ(overrun.errorKind, ErrorKind::STRUCTURAL);
	EXPECT_EQ(overrun.trace.size(), 1u);
}

/* --------------------------------- parsing --------------------------------- */

TEST_F(ScenarioTest, DefaultScheduleRunsThreadsInOrder) {
	Scenario scenario = Scenario::fromJson(json::parse(R"({
	  "threads": [
	    { "instructions": [ [], [] ] },
	    { "instructions": [ [] ] }
	  ],
	  "footprint": [ 4096, "0x2000" ]
	})"));
	EXPECT_EQ(scenario.name, "unnamed");
	EXPECT_EQ(scenario.schedule, (std::vector<size_t>{0, 0, 1}));
	EXPECT_EQ(scenario.footprint, (std::set<Location>{0x1000, 0x2000}));
}

TEST_F(ScenarioTest, MalformedScenariosAreStructural) {
	const std::vector<std::string> malformed = {
	    R"([])",
	    R"({ "threads": [] })",
	    R"({ "threads": [ { "instructions": [ [] ] } ], "schedule": [1] })",
	    R"({ "threads": [ { "instructions": [ [ { "kind": "Nop" } ] ] } ] })",
	    R"({ "threads": [ { "instructions": [ [ { "kind": "Barrier", "type": "dmbx" } ] ] } ] })",
	    R"({ "threads": [ { "instructions": [ [ { "kind": "MemRead" } ] ] } ] })",
	    R"({ "threads": [ { "instructions": [ [ { "kind": "MemRead", "pa": -8 } ] ] } ] })",
	    R"({ "threads": [ { "instructions": [ [ { "kind": "MemRead", "pa": true } ] ] } ] })",
	    R"({ "threads": [ { "instructions": [ [ { "kind": "Tlbi", "asid": 70000 } ] ] } ] })",
	    R"({ "threads": [ { "instructions": [ [ { "kind": "RegWrite", "reg": "x0", "deps": "none" } ] ] } ] })",
	    R"({ "threads": [ { "instructions": [ [] ] } ], "memory": { "0x1004": 1 } })",
	    R"({ "threads": [ { "instructions": [ [] ] } ],
	         "promises": [ { "before_step": 1, "thread": 0, "event": { "kind": "tlbi" } } ] })",
	    R"({ "threads": [ { "instructions": [ [] ] } ],
	         "promises": [ { "before_step": 0, "thread": 0, "event": { "kind": "read" } } ] })",
	};
	for (const auto& text : malformed) {
		EXPECT_THROW(Scenario::fromJson(json::parse(text)), StructuralError) << text;
	}
}

TEST_F(ScenarioTest, EffectJsonFields) {
	EXPECT_EQ(parseNumber(json("0x10")), 16u);
	EXPECT_EQ(parseNumber(json("12")), 12u);
	EXPECT_EQ(parseNumber(json(7)), 7u);
	EXPECT_THROW(parseNumber(json("1x")), StructuralError);

	EXPECT_TRUE(std::holds_alternative<ImplicitAll>(parseDeps(json("all"))));
	EXPECT_EQ(parseDeps(json::parse(R"({ "registers": ["x1"], "reads": [0] })")), explicitDeps({"x1"}, {0}));

	Effect tlbi = parseEffect(json::parse(
	    R"({ "kind": "Tlbi", "scope": "by_va_by_asid", "asid": 3, "va": "0x5000", "last_level_only": true })"));
	ASSERT_TRUE(std::holds_alternative<Tlbi>(tlbi));
	EXPECT_EQ(std::get<Tlbi>(tlbi).scope, TlbiScope::BY_VA_BY_ASID);
	EXPECT_EQ(std::get<Tlbi>(tlbi).asid, 3u);
	EXPECT_TRUE(std::get<Tlbi>(tlbi).lastLevelOnly);
	EXPECT_EQ(std::get<Tlbi>(tlbi).domain, Shareability::INNER);

	Effect acquire = parseEffect(json::parse(R"({ "kind": "MemRead", "pa": 8, "strength": "acquire_pc" })"));
	EXPECT_EQ(std::get<MemRead>(acquire).kind.strength, AccessStrength::ACQUIRE_PC);
	EXPECT_EQ(std::get<MemRead>(acquire).purpose, ReadPurpose::DATA);

	Event event = parseEvent(json::parse(R"({ "kind": "tlbi", "scope": "by_asid", "asid": 3 })"));
	EXPECT_EQ(event, Event(TlbiEvent{TlbiDescriptor{TlbiScope::BY_ASID, 3, 0, false}}));
}

TEST_F(ScenarioTest, FromFile) {
	auto path = this->writeFile("promsim_scenario_mp.json", MESSAGE_PASSING);
	EXPECT_EQ(Scenario::fromFile(path).name, "MP+dmb+dmb");
	std::filesystem::remove(path);

	EXPECT_THROW(Scenario::fromFile("/nonexistent/scenario.json"), StructuralError);

	auto broken = this->writeFile("promsim_scenario_broken.json", "{ \"threads\": ");
	EXPECT_THROW(Scenario::fromFile(broken), StructuralError);
	std::filesystem::remove(broken);
}

/* -------------------------------- front end -------------------------------- */

class ScenarioTopTest : public ScenarioTest {
protected:
	int runTop(std::vector<std::string> _args, ModelParams* _params = nullptr) {
		std::vector<char*> argv;
		for (auto& arg : _args) argv.push_back(arg.data());

		ScenarioTop top("promsim");
		top.init(static_cast<int>(argv.size()), argv.data());
		if (_params) *_params = top.getModelParams();
		return top.finish(top.run());
	}
};

TEST_F(ScenarioTopTest, CommandLineOverridesConfigFile) {
	auto scenario = this->writeFile("promsim_top_mp.json", MESSAGE_PASSING);
	auto config   = this->writeFile("promsim_top_config.json",
	                                R"({ "promsim": { "pa_bits": 40, "max_pending_promises": 3 } })");

	ModelParams params;
	int         code = this->runTop(
        {"promsim", "-q", "-s", scenario, "-c", config, "--pa-bits", "44", "--levels", "3", "--no-forwarding"},
        &params);

	EXPECT_EQ(code, 0);
	EXPECT_EQ(params.paBits, 44u);
	EXPECT_EQ(params.maxPendingPromises, 3u);
	EXPECT_EQ(params.translation.levels, 3u);
	EXPECT_FALSE(params.enableForwarding);
	EXPECT_FALSE(params.traceEffects);

	std::filesystem::remove(scenario);
	std::filesystem::remove(config);
}

TEST_F(ScenarioTopTest, ExitCodeReflectsStatus) {
	auto discarded = this->writeFile("promsim_top_discard.json", R"({
	  "threads": [ { "instructions": [ [ { "kind": "Discard" } ] ] } ]
	})");
	EXPECT_EQ(this->runTop({"promsim", "-q", "--scenario", discarded}), 1);
	std::filesystem::remove(discarded);

	EXPECT_EQ(this->runTop({"promsim", "-q", "--scenario", "/nonexistent/scenario.json"}), 2);
}
