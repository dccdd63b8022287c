#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace libstatengine {
namespace core {

/**
 * Error taxonomy for all statistical routines
 *
 * Every failure is deterministic given its inputs, so none of these are
 * retryable without changing the input.
 */
enum class ErrorKind {
	EmptyDataset,           ///< Sample has zero elements
	InsufficientSampleSize, ///< Sample below the minimum for the computation
	InvalidSampleSize,      ///< Sample outside the valid range of a test (normality)
	InvalidInput,           ///< Malformed input (contingency table shape, non-finite values)
	InvalidParameter,       ///< Parameter outside its domain (df <= 0, alpha not in (0,1))
	DivisionByZero,         ///< Degenerate data (zero variance, zero expected count)
	ConvergenceFailure      ///< Iterative approximation exceeded its iteration cap
};

inline const char *ErrorKindName(ErrorKind kind) {
	switch (kind) {
	case ErrorKind::EmptyDataset:
		return "EmptyDataset";
	case ErrorKind::InsufficientSampleSize:
		return "InsufficientSampleSize";
	case ErrorKind::InvalidSampleSize:
		return "InvalidSampleSize";
	case ErrorKind::InvalidInput:
		return "InvalidInput";
	case ErrorKind::InvalidParameter:
		return "InvalidParameter";
	case ErrorKind::DivisionByZero:
		return "DivisionByZero";
	case ErrorKind::ConvergenceFailure:
		return "ConvergenceFailure";
	default:
		return "Unknown";
	}
}

/**
 * Exception thrown by every libstatengine routine
 *
 * Derives from std::invalid_argument so callers that only know the standard
 * hierarchy can still catch it. The kind identifies the failure class and the
 * context names the offending group or sample (empty when not applicable).
 */
class StatisticsError : public std::invalid_argument {
public:
	StatisticsError(ErrorKind kind, const std::string &message, std::string context = "")
	    : std::invalid_argument(message), kind_(kind), context_(std::move(context)) {
	}

	ErrorKind kind() const noexcept {
		return kind_;
	}

	/// Group key or sample label the error refers to
	const std::string &context() const noexcept {
		return context_;
	}

	/// Rethrow-helper: same kind, message prefixed with the given context
	StatisticsError WithContext(const std::string &context) const {
		return StatisticsError(kind_, "group '" + context + "': " + what(), context);
	}

private:
	ErrorKind kind_;
	std::string context_;
};

} // namespace core
} // namespace libstatengine
