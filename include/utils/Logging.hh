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

#include <atomic>
#include <exception>
#include <sstream>
#include <string>

namespace wrrsim {

/**
 * @file Logging.hh
 * @brief Severity-tagged, cycle-stamped log streams for WRRSim
 *
 * Every message is buffered in a LogOStream temporary and written in one piece
 * when the temporary is destroyed, so messages from the driver, the model and
 * the DUT adapter never interleave mid-line.
 *
 * **Prefix format:**
 * ```
 * Cycle=<n> <Severity>: [<label>] <message>
 * ```
 * `<n>` is the current cycle of the global simulation top, or `N/A` before a
 * top has been created (e.g. in unit tests).
 *
 * **Macros:**
 *
 * | Macro | Label | Notes |
 * |-------|-------|-------|
 * | CLASS_INFO / CLASS_WARNING / CLASS_ERROR | demangled type of `this` | `this` must derive from HashableType |
 * | LABELED_INFO(l) / LABELED_WARNING(l) / LABELED_ERROR(l) | `l` | |
 * | LABELED_STATISTICS(l) | `l` | end-of-run counters |
 * | VERBOSE_CLASS_INFO / VERBOSE_LABELED_INFO(l) | as above | only with WRRSIM_VERBOSE |
 * | CLASS_ASSERT_MSG(c, m) / LABELED_ASSERT_MSG(c, l, m) / ASSERT_MSG(c, m) | | `m` is streamed |
 *
 * ERROR-severity messages and failed assertions throw std::runtime_error whose
 * what() is the formatted message. If nothing catches it, the terminate
 * handler installed by WRRSimTop prints it once and aborts.
 */

enum class LoggingSeverity { L_STATISTICS, L_INFO, L_WARNING, L_ERROR };

/**
 * @brief ANSI Select Graphic Rendition escape code
 */
class ANSI_SGR {
public:
	enum class PARAMETER : int { RESET = 0, BOLD = 1, FG_RED = 31, FG_GREEN = 32, FG_YELLOW = 33, FG_BLUE = 34 };

	explicit ANSI_SGR(PARAMETER _param) : param(_param) {}

	std::string getCode() const { return "\033[" + std::to_string(static_cast<int>(this->param)) + "m"; }

private:
	PARAMETER param;
};

class LogOStream {
public:
	LogOStream(LoggingSeverity _level, const char* _file, int _line, const std::string& _label = "")
	    : level(_level), file(_file), line(_line), label(_label), uncaughtOnEntry(std::uncaught_exceptions()) {
		this->setPrefix();
	}

	/// Flushes the buffered message; throws for L_ERROR unless already unwinding.
	~LogOStream() noexcept(false);

	LogOStream(const LogOStream&)            = delete;
	LogOStream& operator=(const LogOStream&) = delete;

	template <typename T>
	LogOStream& operator<<(const T& _value) {
		this->ss << _value;
		return *this;
	}

	LogOStream& operator<<(std::ostream& (*_manip)(std::ostream&)) {
		this->ss << _manip;
		return *this;
	}

	/// Terminate handler: reports the in-flight exception exactly once, then aborts.
	static void handleTerminate();

private:
	void setPrefix();

	std::stringstream ss;
	LoggingSeverity   level;
	const char*       file;
	int               line;
	std::string       label;
	int               uncaughtOnEntry;

	inline static std::atomic<bool> hasCalledTerminate = false;
};

/**
 * @brief Sink used when a log category is compiled out
 */
class FakeLogOStream {
public:
	template <typename T>
	FakeLogOStream& operator<<(const T&) {
		return *this;
	}

	FakeLogOStream& operator<<(std::ostream& (*)(std::ostream&)) { return *this; }
};

}  // namespace wrrsim

#define WRRSIM_LOG(severity, label) wrrsim::LogOStream(wrrsim::LoggingSeverity::severity, __FILE__, __LINE__, label)

#ifndef NO_LOGS
#define LABELED_INFO(label)       WRRSIM_LOG(L_INFO, label)
#define LABELED_WARNING(label)    WRRSIM_LOG(L_WARNING, label)
#define LABELED_STATISTICS(label) WRRSIM_LOG(L_STATISTICS, label)
#else
#define LABELED_INFO(label)       wrrsim::FakeLogOStream()
#define LABELED_WARNING(label)    wrrsim::FakeLogOStream()
#define LABELED_STATISTICS(label) wrrsim::FakeLogOStream()
#endif  // #ifndef NO_LOGS

#define LABELED_ERROR(label) WRRSIM_LOG(L_ERROR, label)

#define CLASS_INFO    LABELED_INFO(this->getTypeName())
#define CLASS_WARNING LABELED_WARNING(this->getTypeName())
#define CLASS_ERROR   LABELED_ERROR(this->getTypeName())

#ifdef WRRSIM_VERBOSE
#define VERBOSE_LABELED_INFO(label) LABELED_INFO(label)
#define VERBOSE_CLASS_INFO          CLASS_INFO
#else
#define VERBOSE_LABELED_INFO(label) wrrsim::FakeLogOStream()
#define VERBOSE_CLASS_INFO          wrrsim::FakeLogOStream()
#endif  // #ifdef WRRSIM_VERBOSE

#define LABELED_ASSERT_MSG(cond, label, msg)                                          \
	do {                                                                              \
		if (!(cond)) { LABELED_ERROR(label) << "Assertion `" #cond "` failed: " << msg; } \
	} while (0)

#define CLASS_ASSERT_MSG(cond, msg) LABELED_ASSERT_MSG(cond, this->getTypeName(), msg)
#define ASSERT_MSG(cond, msg)       LABELED_ASSERT_MSG(cond, "WRRSim", msg)
