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
 * @file Errors.hh
 * @brief Fatal error classes raised by the model
 *
 * @details
 * Two classes of fatal errors exist and must never be confused with a path
 * being discarded:
 * - UnsupportedError: the effect is outside what the model implements
 *   (read-modify-write atomics, non-shareable barriers, odd access sizes, ...).
 * - StructuralError: the input itself is malformed (address beyond the
 *   physical address width, register without a known mapping, bad scenario file).
 *
 * Path violations are not exceptions; they surface as StepStatus::DISCARD.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace promsim {

enum class ErrorKind { NONE = 0, UNSUPPORTED, STRUCTURAL };

class PromSimError : public std::runtime_error {
public:
	PromSimError(ErrorKind _kind, const std::string& _msg) : std::runtime_error(_msg), kind(_kind) {}

	ErrorKind getKind() const { return this->kind; }

private:
	ErrorKind kind;
};

class UnsupportedError : public PromSimError {
public:
	explicit UnsupportedError(const std::string& _what)
	    : PromSimError(ErrorKind::UNSUPPORTED, "unsupported: " + _what) {}
};

class StructuralError : public PromSimError {
public:
	explicit StructuralError(const std::string& _what) : PromSimError(ErrorKind::STRUCTURAL, "structural: " + _what) {}
};

inline const char* toString(ErrorKind _kind) {
	switch (_kind) {
		case ErrorKind::UNSUPPORTED: return "unsupported";
		case ErrorKind::STRUCTURAL: return "structural";
		default: return "none";
	}
}

}  // namespace promsim
