#pragma once

#include <cstdint>
#include <sstream>
#include <string>

namespace libstatengine {
namespace utils {

/**
 * @brief Level-filtered diagnostic logging
 *
 * Provides:
 * - Log levels (trace, debug, info, warn, error, none)
 * - Timestamped stderr output with file/line info
 * - Timing measurements for longer computations
 * - Thread-safe output
 *
 * Control via environment variable: STATENGINE_LOG_LEVEL
 * Values: trace, debug, info, warn, error, none
 * Default: warn in release builds, info in debug builds
 *
 * Example usage:
 *   STATENGINE_DEBUG("Welch t-test: t=" << t << ", df=" << df);
 *   STATENGINE_TIMING_START();
 *   // ... do work ...
 *   STATENGINE_TIMING_END("Shapiro-Wilk");
 */

enum class LogLevel { TRACE = 0, DBG = 1, INFO = 2, WARN = 3, ERR = 4, NONE = 5 };

class Tracer {
public:
	/**
	 * @brief Initialize tracing system
	 *
	 * Reads STATENGINE_LOG_LEVEL environment variable
	 */
	static void Initialize();

	/**
	 * @brief Set global log level
	 *
	 * @param level Minimum level to output
	 */
	static void SetLogLevel(LogLevel level);

	static LogLevel GetLogLevel();

	/**
	 * @brief Check if a message at given level should be logged
	 */
	static bool ShouldLog(LogLevel level);

	/**
	 * @brief Parse a level name (case-insensitive)
	 *
	 * @param name One of trace, debug, info, warn, error, none
	 * @param fallback Level returned for unrecognized names
	 */
	static LogLevel ParseLevel(const std::string &name, LogLevel fallback);

	/**
	 * @brief Log a message with location information
	 *
	 * @param level Message level
	 * @param file Source file name
	 * @param line Source line number
	 * @param message Message content
	 */
	static void Log(LogLevel level, const std::string &file, int line, const std::string &message);

	static void LogDirect(LogLevel level, const std::string &message);

	static std::string GetLevelName(LogLevel level);

	static std::string GetTimestamp();

	/**
	 * @brief Start a timed operation
	 *
	 * @return Opaque handle for timing
	 */
	static uint64_t TimingStart();

	/**
	 * @brief End a timed operation and log duration at DEBUG
	 *
	 * @return Duration in milliseconds
	 */
	static double TimingEnd(uint64_t handle, const std::string &operation_name);

private:
	Tracer() = delete;
	~Tracer() = delete;
};

} // namespace utils
} // namespace libstatengine

// ============================================================================
// Convenience Macros for Logging
// ============================================================================

#define STATENGINE_LOG_AT(level, msg)                                                                                  \
	do {                                                                                                               \
		if (::libstatengine::utils::Tracer::ShouldLog(level)) {                                                        \
			std::ostringstream statengine_oss_;                                                                        \
			statengine_oss_ << msg;                                                                                    \
			::libstatengine::utils::Tracer::Log(level, __FILE__, __LINE__, statengine_oss_.str());                     \
		}                                                                                                              \
	} while (0)

/**
 * @brief Stream-syntax logging macros
 *
 * Usage: STATENGINE_DEBUG(message << stream << contents)
 */
#define STATENGINE_TRACE(msg) STATENGINE_LOG_AT(::libstatengine::utils::LogLevel::TRACE, msg)
#define STATENGINE_DEBUG(msg) STATENGINE_LOG_AT(::libstatengine::utils::LogLevel::DBG, msg)
#define STATENGINE_INFO(msg)  STATENGINE_LOG_AT(::libstatengine::utils::LogLevel::INFO, msg)
#define STATENGINE_WARN(msg)  STATENGINE_LOG_AT(::libstatengine::utils::LogLevel::WARN, msg)
#define STATENGINE_ERROR(msg) STATENGINE_LOG_AT(::libstatengine::utils::LogLevel::ERR, msg)

/**
 * @brief Macro for timing operations
 *
 * Usage:
 *   STATENGINE_TIMING_START();
 *   // ... do work ...
 *   STATENGINE_TIMING_END("Operation name");
 */
#define STATENGINE_TIMING_START() uint64_t statengine_timing_handle_ = ::libstatengine::utils::Tracer::TimingStart()

#define STATENGINE_TIMING_END(operation_name)                                                                          \
	::libstatengine::utils::Tracer::TimingEnd(statengine_timing_handle_, operation_name)
