#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace libstatengine {
namespace core {

/// Contingency table of non-negative counts (rows x columns)
using CountMatrix = Eigen::Matrix<int64_t, Eigen::Dynamic, Eigen::Dynamic>;

/**
 * Two-sided confidence interval
 */
struct ConfidenceInterval {
	double lower_bound = 0.0;
	double upper_bound = 0.0;

	/// Confidence level used (e.g., 0.95 for 95% CI)
	double confidence_level = 0.95;

	ConfidenceInterval() = default;

	ConfidenceInterval(double lower, double upper, double level)
	    : lower_bound(lower), upper_bound(upper), confidence_level(level) {
	}

	bool Contains(double value) const {
		return value >= lower_bound && value <= upper_bound;
	}

	double width() const {
		return upper_bound - lower_bound;
	}
};

/**
 * Result of a one-sample, paired or two-sample t-test
 *
 * All p-values are two-tailed. The confidence interval is on the mean
 * (one-sample, paired) or on mean(a) - mean(b) (two-sample).
 */
struct TTestResult {
	/// "One-sample t-test", "Paired t-test", "Welch two-sample t-test", ...
	std::string test_name;

	/// t = estimate_offset / standard_error
	double t_statistic = 0.0;

	/// Two-tailed p-value, in [0, 1]
	double p_value = 1.0;

	/// Degrees of freedom (real-valued for Welch's test)
	double degrees_of_freedom = 0.0;

	/// p_value < alpha (strict)
	bool is_significant = false;

	/// Sample mean, or difference of means for two-sample tests
	double estimate = 0.0;

	double standard_error = 0.0;

	ConfidenceInterval confidence_interval;

	/// Standardized mean difference (|mean - mu0| / sd or |Cohen's d|)
	double effect_size = 0.0;

	/// Significance threshold used
	double alpha = 0.05;
};

/**
 * Result of a chi-square test of independence
 */
struct ChiSquareResult {
	double chi_square_statistic = 0.0;

	/// Upper-tail p-value of chi-square(df), in [0, 1]
	double p_value = 1.0;

	/// (rows - 1) * (cols - 1)
	size_t degrees_of_freedom = 0;

	bool is_significant = false;

	/// Cramér's V: 0 = no association, 1 = perfect association
	double cramers_v = 0.0;

	/// Expected counts under independence (same shape as the input table)
	Eigen::MatrixXd expected;

	/// Sum of all observed counts
	int64_t grand_total = 0;

	double alpha = 0.05;
};

/**
 * Result of a normality test (Shapiro-Wilk or Jarque-Bera)
 */
struct NormalityTestResult {
	/// "Shapiro-Wilk" or "Jarque-Bera"
	std::string test_name;

	/// W for Shapiro-Wilk, JB for Jarque-Bera
	double statistic = 0.0;

	double p_value = 1.0;

	/// p_value > alpha: normality cannot be rejected
	bool is_normal = true;

	size_t sample_size = 0;

	double alpha = 0.05;
};

/**
 * Result of a Pearson correlation test (H0: rho = 0)
 */
struct CorrelationResult {
	/// Pearson's r, in [-1, 1]
	double coefficient = 0.0;

	/// t = r * sqrt((n - 2) / (1 - r²)); infinite for |r| = 1
	double t_statistic = 0.0;

	double p_value = 1.0;

	/// n - 2
	double degrees_of_freedom = 0.0;

	bool is_significant = false;

	/// Fisher-z interval on rho; present only when n >= 4
	std::optional<ConfidenceInterval> confidence_interval;

	size_t sample_size = 0;

	double alpha = 0.05;
};

} // namespace core
} // namespace libstatengine
