#pragma once

#include "../core/inference_result.hpp"
#include "../core/sample.hpp"
#include "../core/test_options.hpp"
#include <Eigen/Dense>
#include <cstdint>
#include <vector>

namespace libstatengine {
namespace inference {

/**
 * HypothesisTests: classical significance tests on raw samples
 *
 * This class provides:
 * - One-sample t-test of H0: mean = mu0
 * - Two-sample t-test of H0: mean_a = mean_b (Welch or pooled Student)
 * - Paired t-test of H0: mean(a - b) = 0
 * - Chi-square test of independence on a contingency table
 * - Pearson correlation test of H0: rho = 0
 *
 * The t-tests follow the standard theory:
 * - SE = s / sqrt(n)                       (one-sample)
 * - SE = sqrt(s_a²/n_a + s_b²/n_b)         (Welch)
 * - df = SE⁴ / ((s_a²/n_a)²/(n_a-1) + (s_b²/n_b)²/(n_b-1))   (Welch-Satterthwaite)
 * - p = 2 * P(T > |t|),  T ~ t(df)
 * - CI = estimate ± t_{alpha/2, df} * SE
 *
 * All p-values are two-tailed and "significant" means p < alpha (strict).
 * Moments come from descriptive::DescriptiveCalculator and probabilities
 * from utils/distributions.hpp. Stateless design (all methods are static).
 */
class HypothesisTests {
public:
	/// Expected count below which the chi-square approximation is flagged
	static constexpr double kChiSquareMinExpected = 5.0;

	/**
	 * One-sample t-test
	 *
	 * @param sample Sample (n >= 2, non-zero variance)
	 * @param hypothesized_mean mu0
	 * @param alpha Significance threshold in (0, 1)
	 * @return TTestResult with df = n - 1 and effect size |mean - mu0| / s
	 */
	static core::TTestResult OneSampleTTest(const core::Sample &sample, double hypothesized_mean,
	                                        double alpha = 0.05);

	static core::TTestResult OneSampleTTest(const std::vector<double> &sample, double hypothesized_mean,
	                                        double alpha = 0.05);

	/**
	 * Welch two-sample t-test (unequal variances)
	 *
	 * The estimate and confidence interval refer to mean(a) - mean(b). The
	 * effect size is |Cohen's d| with the pooled standard deviation.
	 *
	 * @throws StatisticsError InsufficientSampleSize if either n < 2 (context
	 *         "sample_a" / "sample_b"), DivisionByZero if both variances are 0
	 */
	static core::TTestResult TwoSampleTTest(const core::Sample &sample_a, const core::Sample &sample_b,
	                                        double alpha = 0.05);

	/**
	 * Two-sample t-test with explicit options
	 *
	 * options.equal_variance selects Student's pooled-variance test.
	 */
	static core::TTestResult TwoSampleTTest(const core::Sample &sample_a, const core::Sample &sample_b,
	                                        const core::TestOptions &options);

	static core::TTestResult TwoSampleTTest(const std::vector<double> &sample_a, const std::vector<double> &sample_b,
	                                        double alpha = 0.05);

	/**
	 * Paired t-test: one-sample test of the differences a_i - b_i against 0
	 *
	 * @throws StatisticsError InvalidInput if the samples differ in length
	 */
	static core::TTestResult PairedTTest(const core::Sample &sample_a, const core::Sample &sample_b,
	                                     double alpha = 0.05);

	/**
	 * Chi-square test of independence
	 *
	 * expected_ij = row_i * col_j / N,  χ² = Σ (O - E)² / E,
	 * df = (r - 1)(c - 1),  V = sqrt(χ² / (N (min(r, c) - 1)))
	 *
	 * @param table Non-negative counts, at least 2 x 2
	 * @throws StatisticsError InvalidInput for bad shape or negative counts,
	 *         DivisionByZero if any expected count is zero
	 */
	static core::ChiSquareResult ChiSquareTest(const core::CountMatrix &table, double alpha = 0.05);

	/**
	 * Chi-square test on a nested-vector table
	 *
	 * @throws StatisticsError InvalidInput if rows differ in length
	 */
	static core::ChiSquareResult ChiSquareTest(const std::vector<std::vector<int64_t>> &table, double alpha = 0.05);

	/**
	 * Pearson correlation test of H0: rho = 0
	 *
	 * t = r * sqrt((n - 2) / (1 - r²)) ~ t(n - 2). The Fisher-z interval
	 * tanh(atanh(r) ± z_{alpha/2} / sqrt(n - 3)) is reported when n >= 4.
	 *
	 * @throws StatisticsError InvalidInput if lengths differ,
	 *         InsufficientSampleSize if n < 3, DivisionByZero on zero variance
	 */
	static core::CorrelationResult PearsonCorrelationTest(const core::Sample &x, const core::Sample &y,
	                                                      double alpha = 0.05);

private:
	/// estimate ± t_{alpha/2, df} * se
	static core::ConfidenceInterval ComputeConfidenceInterval(double estimate, double standard_error, double df,
	                                                          double alpha);

	static void ValidateAlpha(double alpha);

	static void ValidateEqualLength(const core::Sample &a, const core::Sample &b, const std::string &operation);
};

} // namespace inference
} // namespace libstatengine

#include "hypothesis_tests_impl.hpp"
