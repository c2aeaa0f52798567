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
 * @file Logging.hh
 * @brief Stream-style logging and assertion macros for PromSim
 *
 * @details
 * Every log line is built in a LogOStream temporary and flushed when the temporary
 * is destroyed at the end of the full expression:
 *
 * @code{.cpp}
 * CLASS_INFO << "Promise created at t=" << t;
 * LABELED_WARNING("Scenario") << "Unknown key '" << key << "' ignored.";
 * LABELED_ASSERT_MSG(iter != map.end(), this->name, "Missing entry " << key);
 * @endcode
 *
 * L_ERROR messages are printed and then thrown as std::runtime_error, so the
 * *_ERROR and *_ASSERT* macros never return on failure.
 *
 * - CLASS_* macros label the line with the demangled dynamic type of `this`
 *   (the class must derive from HashableType).
 * - LABELED_* macros take the label explicitly.
 * - VERBOSE_* macros are compiled in only when PROMSIM_VERBOSE is defined.
 * - Defining NO_LOGS turns informational output into no-ops; errors still throw.
 */

#pragma once

#include <atomic>
#include <sstream>
#include <stdexcept>
#include <string>

#include "utils/HashableType.hh"

namespace promsim {

enum class LoggingSeverity { L_INFO, L_WARNING, L_ERROR, L_STATISTICS };

/**
 * @brief ANSI Select Graphic Rendition escape code
 */
class ANSI_SGR {
public:
	enum class PARAMETER : int { RESET = 0, BOLD = 1, FG_RED = 31, FG_GREEN = 32, FG_YELLOW = 33, FG_BLUE = 34 };

	ANSI_SGR(PARAMETER _param) : param(_param) {}

	std::string getCode() const { return "\033[" + std::to_string(static_cast<int>(this->param)) + "m"; }

private:
	PARAMETER param;
};

/**
 * @brief Temporary stream object that emits one log line on destruction
 */
class LogOStream {
public:
	LogOStream(LoggingSeverity _level, const char* _file, int _line, const std::string& _label = "")
	    : level(_level), file(_file), line(_line) {
		this->setPrefix();
		if (!_label.empty()) this->ss << "[" << _label << "] ";
	}

	// Throws for L_ERROR; the destructor is deliberately not noexcept.
	~LogOStream() noexcept(false);

	template <typename T>
	LogOStream& operator<<(const T& _value) {
		this->ss << _value;
		return *this;
	}

	LogOStream& operator<<(std::ostream& (*_manip)(std::ostream&)) {
		this->ss << _manip;
		return *this;
	}

	/**
	 * @brief std::terminate handler printing the pending exception once
	 *
	 * Install with `std::set_terminate(&LogOStream::handleTerminate)` in main().
	 */
	[[noreturn]] static void handleTerminate();

	/** @brief Mute all non-error output (used by quiet test runs) */
	static void setQuiet(bool _quiet) { LogOStream::quiet.store(_quiet); }

private:
	void setPrefix();

	LoggingSeverity   level;
	const char*       file;
	int               line;
	std::stringstream ss;

	static std::atomic<bool> hasCalledTerminate;
	static std::atomic<bool> quiet;
};

/**
 * @brief Sink used when logging is compiled out
 */
class FakeLogOStream {
public:
	template <typename T>
	FakeLogOStream& operator<<(const T&) {
		return *this;
	}

	FakeLogOStream& operator<<(std::ostream& (*)(std::ostream&)) { return *this; }
};

}  // namespace promsim

#define PROMSIM_LOG(level, label) promsim::LogOStream(promsim::LoggingSeverity::level, __FILE__, __LINE__, label)

#ifndef NO_LOGS
#define CLASS_INFO          PROMSIM_LOG(L_INFO, this->getTypeName())
#define CLASS_WARNING       PROMSIM_LOG(L_WARNING, this->getTypeName())
#define LABELED_INFO(label) PROMSIM_LOG(L_INFO, label)
#define LABELED_WARNING(label) PROMSIM_LOG(L_WARNING, label)
#define LABELED_STATISTICS(label) PROMSIM_LOG(L_STATISTICS, label)
#else
#define CLASS_INFO             promsim::FakeLogOStream()
#define CLASS_WARNING          promsim::FakeLogOStream()
#define LABELED_INFO(label)    promsim::FakeLogOStream()
#define LABELED_WARNING(label) promsim::FakeLogOStream()
#define LABELED_STATISTICS(label) promsim::FakeLogOStream()
#endif  // #ifndef NO_LOGS

#define CLASS_ERROR          PROMSIM_LOG(L_ERROR, this->getTypeName())
#define LABELED_ERROR(label) PROMSIM_LOG(L_ERROR, label)

#if defined(PROMSIM_VERBOSE) && !defined(NO_LOGS)
#define VERBOSE_CLASS_INFO           CLASS_INFO
#define VERBOSE_LABELED_INFO(label)  LABELED_INFO(label)
#else
#define VERBOSE_CLASS_INFO           promsim::FakeLogOStream()
#define VERBOSE_LABELED_INFO(label)  promsim::FakeLogOStream()
#endif  // PROMSIM_VERBOSE

#define ASSERT_MSG(expr, msg) \
	do {                      \
		if (!(expr)) { LABELED_ERROR("PromSim") << "Assertion `" #expr "` failed: " << msg; } \
	} while (0)

#define CLASS_ASSERT_MSG(expr, msg) \
	do {                            \
		if (!(expr)) { CLASS_ERROR << "Assertion `" #expr "` failed: " << msg; } \
	} while (0)

#define LABELED_ASSERT_MSG(expr, label, msg) \
	do {                                     \
		if (!(expr)) { LABELED_ERROR(label) << "Assertion `" #expr "` failed: " << msg; } \
	} while (0)

#define CLASS_ASSERT(expr)           CLASS_ASSERT_MSG(expr, "")
#define LABELED_ASSERT(expr, label)  LABELED_ASSERT_MSG(expr, label, "")
