#pragma once

#include "errors.hpp"

#include <cmath>
#include <string>

namespace libstatengine {
namespace core {

/**
 * Configuration options for hypothesis tests
 *
 * Every test accepts a plain alpha (default 0.05) in its signature; this
 * struct is the richer form used where a test has more than one knob.
 *
 * Design notes:
 * - All defaults specified in-class
 * - No global state: callers pass options per call
 * - Validate() reports invalid values as InvalidParameter
 */
struct TestOptions {
	/// Significance threshold; a result is significant when p < alpha
	/// Default: 0.05
	double alpha = 0.05;

	/// Two-sample t-test flavour
	/// - false: Welch's unequal-variance test (Welch-Satterthwaite df)
	/// - true: Student's pooled-variance test (df = n_a + n_b - 2)
	/// Default: false
	bool equal_variance = false;

	TestOptions() = default;

	/// Confidence level of the intervals reported alongside a test
	double confidence_level() const {
		return 1.0 - alpha;
	}

	/// Welch two-sample test at the given alpha
	static TestOptions Welch(double alpha_ = 0.05) {
		TestOptions opts;
		opts.alpha = alpha_;
		opts.equal_variance = false;
		return opts;
	}

	/// Pooled-variance Student two-sample test at the given alpha
	static TestOptions Pooled(double alpha_ = 0.05) {
		TestOptions opts;
		opts.alpha = alpha_;
		opts.equal_variance = true;
		return opts;
	}

	/**
	 * Validate option values
	 *
	 * @throws StatisticsError (InvalidParameter) if alpha is not in (0, 1)
	 */
	void Validate() const {
		if (std::isnan(alpha) || alpha <= 0.0 || alpha >= 1.0) {
			throw StatisticsError(ErrorKind::InvalidParameter,
			                      "alpha must be in (0, 1) (got " + std::to_string(alpha) + ")");
		}
	}
};

} // namespace core
} // namespace libstatengine
