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
 * @file SimConfig.hh
 * @brief Typed, JSON-loadable parameter container
 *
 * SimConfig stores named parameters of arbitrary type behind a type-erased map,
 * parses them from JSON, and gives access to individual members of struct
 * parameters registered with SPECIALIZE_PARAMETER.
 *
 * **Parameter layout of the model config:**
 * ```
 * SimConfig "promsim"
 *   ├─ Parameter<int>               "pa_bits"
 *   ├─ Parameter<int>               "max_pending_promises"
 *   ├─ Parameter<bool>              "enable_forwarding"
 *   ├─ Parameter<bool>              "trace_effects"
 *   └─ Parameter<TranslationParams> "translation"
 *         ├─ getValue<uint32_t>("levels")
 *         └─ setValue<uint32_t>("granuleBits", 16)
 * ```
 *
 * **Usage Example:**
 * ```cpp
 * SPECIALIZE_PARAMETER(TranslationParams, uint32_t,
 *     MAKE_MEMBER_PAIR(TranslationParams, levels),
 *     MAKE_MEMBER_PAIR(TranslationParams, granuleBits),
 *     MAKE_MEMBER_PAIR(TranslationParams, vaBits))
 *
 * SimConfig config("promsim");
 * config.addParameter("pa_bits", 48, ParamType::INT);
 * config.addParameter("translation", TranslationParams(), ParamType::USER_DEFINED);
 *
 * int      paBits = config.getParameter<int>("pa_bits");
 * uint32_t levels = config.getParameterMemberData<TranslationParams, uint32_t>("translation", "levels");
 *
 * config.parseParameters(nlohmann::json{{"pa_bits", 40}});
 * ```
 *
 * @see SimConfigManager For multi-config management
 * @see CLIManager For command-line integration
 */

#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>

#include "utils/HashableType.hh"
#include "utils/Logging.hh"

// Third-Party Library
#include <nlohmann/json.hpp>

namespace promsim {

using json = nlohmann::json;

class SimConfigManager;

/**
 * @enum ParamType
 * @brief How parseParameters() decodes a parameter from JSON
 *
 * Primitive kinds are decoded automatically; USER_DEFINED parameters go through
 * parseParametersUserDefined().
 */
enum class ParamType {
	INT,          ///< int
	FLOAT,        ///< float
	STRING,       ///< std::string
	BOOL,         ///< bool
	USER_DEFINED  ///< structs and enums
};

/**
 * @class ParameterBase
 * @brief Type-erased base of Parameter<T>
 */
class ParameterBase {
public:
	ParameterBase(std::string _name, ParamType _type) : name(_name), type(_type) {}

	virtual ~ParameterBase() = default;

	std::string getName() const { return this->name; }

	ParamType getType() const { return this->type; }

private:
	std::string name;
	ParamType   type;
};

/**
 * @class Parameter<T>
 * @brief Typed parameter storage
 *
 * getValue()/setValue() with an empty member name access the whole value; the
 * SPECIALIZE_PARAMETER macro adds by-name access to struct members.
 *
 * @tparam T Parameter value type
 */
template <typename T>
class Parameter : public ParameterBase {
public:
	Parameter(const std::string& _name, const T& _value, ParamType _type)
	    : ParameterBase(_name, _type), value(_value) {}

	~Parameter() override = default;

	/**
	 * @throws std::runtime_error if TParam is not T
	 */
	template <typename TParam>
	void setValue(const std::string& _member_name, const TParam& _value) {
		if constexpr (std::is_same_v<TParam, T>) {
			this->value = _value;
		} else {
			throw std::runtime_error("Type mismatch! Expected " + std::string(typeid(T).name()) + " but got " +
			                         std::string(typeid(TParam).name()) + ".");
		}
	}

	/**
	 * @throws std::runtime_error if TParam is not T
	 */
	template <typename TParam>
	TParam getValue(const std::string& _member_name) const {
		if constexpr (std::is_same_v<T, TParam>) {
			return this->value;
		} else {
			throw std::runtime_error("Type mismatch! Expected " + std::string(typeid(T).name()) + " but got " +
			                         std::string(typeid(TParam).name()) + ".");
		}
	}

private:
	T value;
};

#define FLATTEN(...) __VA_ARGS__

/**
 * @def SPECIALIZE_PARAMETER
 * @brief Enable by-name access to the `Type` members of a struct parameter
 *
 * Call once per (struct type, member type) pair, at namespace scope in
 * namespace promsim, with one MAKE_MEMBER_PAIR per member.
 */
#define SPECIALIZE_PARAMETER(ParamterStructType, Type, ...)                                                           \
	template <>                                                                                                       \
	template <>                                                                                                       \
	inline Type Parameter<ParamterStructType>::getValue<Type>(const std::string& member_name) const {                 \
		static const std::unordered_map<std::string, Type ParamterStructType::*> member_map = {FLATTEN(__VA_ARGS__)}; \
		auto                                                                     it = member_map.find(member_name);   \
		if (it != member_map.end()) {                                                                                 \
			return this->value.*(it->second);                                                                         \
		} else {                                                                                                      \
			throw std::runtime_error("Member not found: " + member_name);                                             \
		}                                                                                                             \
	}                                                                                                                 \
	template <>                                                                                                       \
	template <>                                                                                                       \
	inline void Parameter<ParamterStructType>::setValue<Type>(const std::string& member_name, const Type& value) {    \
		static const std::unordered_map<std::string, Type ParamterStructType::*> member_map = {FLATTEN(__VA_ARGS__)}; \
		auto                                                                     it = member_map.find(member_name);   \
		if (it != member_map.end()) {                                                                                 \
			this->value.*(it->second) = value;                                                                        \
		} else {                                                                                                      \
			throw std::runtime_error("Member not found: " + member_name);                                             \
		}                                                                                                             \
	}

/**
 * @def MAKE_MEMBER_PAIR
 * @brief `{"member", &Struct::member}` entry for SPECIALIZE_PARAMETER
 */
#define MAKE_MEMBER_PAIR(ParamterStructType, Member) \
	{ #Member, &ParamterStructType::Member }

/**
 * @class SimConfig
 * @brief Named collection of typed parameters
 *
 * Subclasses register their parameters with addParameter() in the constructor
 * and override parseParametersUserDefined() for USER_DEFINED ones. Values are
 * then read with getParameter() / getParameterMemberData().
 *
 * **Parameter lifecycle:**
 * ```
 * 1. Registration:  addParameter("pa_bits", 48, ParamType::INT)
 * 2. JSON loading:  parseParameters(j)          (SimConfigManager)
 * 3. CLI override:  setParameter("pa_bits", 40) (CLIManager)
 * 4. Access:        getParameter<int>("pa_bits")
 * ```
 */
class SimConfig : virtual public HashableType {
	friend class SimConfigManager;

public:
	SimConfig(const std::string& _name) : name(_name) {}

	~SimConfig() {
		for (auto& it : parameters) {
			VERBOSE_LABELED_INFO(this->name) << "Deleting Parameter objects : " << it.first;
			delete it.second;
		}
	}

	std::string getName() const { return this->name; }

	template <typename T>
	T getParameter(const std::string& _name) const;

	template <typename TStruct, typename T>
	T getParameterMemberData(const std::string& _name, const std::string& _member_name) const;

	template <typename T>
	void setParameter(const std::string& _name, const T& _value);

	template <typename TStruct, typename T>
	void setParameterMemberData(const std::string& _name, const std::string& _member_name, const T& _value);

	/**
	 * @brief Update registered parameters from a JSON object
	 *
	 * Unknown keys are skipped with a warning. A value of the wrong JSON type
	 * raises nlohmann::json::type_error.
	 *
	 * ```json
	 * { "pa_bits": 40, "trace_effects": true, "translation": { "levels": 3 } }
	 * ```
	 */
	void parseParameters(const json& _params);

protected:
	/**
	 * @brief Decode a USER_DEFINED parameter
	 *
	 * The base implementation does nothing. Overrides usually rely on a
	 * from_json() overload or NLOHMANN_JSON_SERIALIZE_ENUM for the type:
	 * ```cpp
	 * void parseParametersUserDefined(const std::string& _paramName, const json& _paramValue) override {
	 *     if (_paramName == "translation") {
	 *         TranslationParams p = this->getParameter<TranslationParams>(_paramName);
	 *         from_json(_paramValue, p);
	 *         this->setParameter<TranslationParams>(_paramName, p);
	 *     }
	 * }
	 * ```
	 */
	virtual void parseParametersUserDefined(const std::string& _paramName, const json& _paramValue) {}

	/**
	 * @brief Register a parameter with its default value
	 * @note Names must be unique within one SimConfig
	 */
	template <typename T>
	void addParameter(const std::string& _name, const T& _value, ParamType _type);

	/** @brief Replace a parameter's storage; takes ownership of `_param` */
	void updateParameter(const std::string& _name, ParameterBase* _param);

private:
	template <typename T>
	Parameter<T>* getParameterPtr(const std::string& _name) const;

	std::unordered_map<std::string, ParameterBase*> parameters;

	const std::string name;
};

}  // end of namespace promsim

#include "config/SimConfig.inl"
