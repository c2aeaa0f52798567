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

#pragma once

#include <cxxabi.h>

#include <cstdlib>
#include <string>
#include <type_traits>
#include <typeinfo>

#include "config/SimConfig.hh"
#include "utils/Logging.hh"

namespace promsim {

namespace detail {

// parseParameters() decodes primitive kinds as exactly these C++ types.
template <typename T>
constexpr bool matchesParamType(ParamType _type) {
	switch (_type) {
		case ParamType::INT: return std::is_same_v<T, int>;
		case ParamType::FLOAT: return std::is_same_v<T, float>;
		case ParamType::STRING: return std::is_same_v<T, std::string>;
		case ParamType::BOOL: return std::is_same_v<T, bool>;
		default: return true;
	}
}

template <typename T>
std::string typeName() {
	int         status    = 0;
	char*       demangled = abi::__cxa_demangle(typeid(T).name(), nullptr, nullptr, &status);
	std::string name      = (status == 0 && demangled) ? demangled : typeid(T).name();
	std::free(demangled);
	return name;
}

}  // namespace detail

template <typename T>
void SimConfig::addParameter(const std::string& _name, const T& _value, ParamType _type) {
	LABELED_ASSERT_MSG(!this->parameters.contains(_name), this->name,
	                   "Parameter \'" + _name + "\' already exists in `SimConfig::parameters`.");
	LABELED_ASSERT_MSG(detail::matchesParamType<T>(_type), this->name,
	                   "Parameter \'" + _name + "\' is registered as " + detail::typeName<T>() +
	                       " but its ParamType decodes another type.");

	auto param = new Parameter<T>(_name, _value, _type);
	VERBOSE_LABELED_INFO(this->name) << "Adding parameter: \'" << _name << "\' to SimConfig.";

	this->parameters.emplace(_name, param);
}

template <typename T>
void SimConfig::setParameter(const std::string& _name, const T& _value) {
	VERBOSE_LABELED_INFO(this->name) << "Parameter \'" + _name + "\' is updated";
	this->getParameterPtr<T>(_name)->template setValue<T>("", _value);
}

template <typename T>
T SimConfig::getParameter(const std::string& _name) const {
	return this->getParameterPtr<T>(_name)->template getValue<T>("");
}

template <typename TStruct, typename T>
void SimConfig::setParameterMemberData(const std::string& _name, const std::string& _member_name, const T& _value) {
	VERBOSE_LABELED_INFO(this->name) << "Parameter \'" + _name + "::" + _member_name + "\' is updated";
	return this->getParameterPtr<TStruct>(_name)->template setValue<T>(_member_name, _value);
}

template <typename TStruct, typename T>
T SimConfig::getParameterMemberData(const std::string& _name, const std::string& _member_name) const {
	return this->getParameterPtr<TStruct>(_name)->template getValue<T>(_member_name);
}

template <typename T>
Parameter<T>* SimConfig::getParameterPtr(const std::string& _name) const {
	auto iter = this->parameters.find(_name);
	LABELED_ASSERT_MSG(iter != this->parameters.end(), this->name, "The parameter \'" + _name + "\' does not exist.");

	auto param = dynamic_cast<Parameter<T>*>(iter->second);
	LABELED_ASSERT_MSG(param, this->name, "Type mismatch for parameter \'" + _name + "\': requested " + detail::typeName<T>() + ".");

	return param;
}

}  // namespace promsim
