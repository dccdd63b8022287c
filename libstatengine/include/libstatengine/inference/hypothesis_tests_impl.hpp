#pragma once

#include "hypothesis_tests.hpp"
#include "../descriptive/descriptive_statistics.hpp"
#include "../utils/distributions.hpp"
#include "../utils/tracing.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace libstatengine {
namespace inference {

// Implementation of HypothesisTests methods

inline void HypothesisTests::ValidateAlpha(double alpha) {
	core::TestOptions options;
	options.alpha = alpha;
	options.Validate();
}

inline void HypothesisTests::ValidateEqualLength(const core::Sample &a, const core::Sample &b,
                                                 const std::string &operation) {
	if (a.size() != b.size()) {
		throw core::StatisticsError(core::ErrorKind::InvalidInput,
		                            operation + " requires samples of equal length (got " +
		                                std::to_string(a.size()) + " and " + std::to_string(b.size()) + ")");
	}
}

inline core::ConfidenceInterval HypothesisTests::ComputeConfidenceInterval(double estimate, double standard_error,
                                                                           double df, double alpha) {
	const double t_crit = utils::student_t_critical(alpha / 2.0, df);
	return core::ConfidenceInterval(estimate - t_crit * standard_error, estimate + t_crit * standard_error,
	                                1.0 - alpha);
}

inline core::TTestResult HypothesisTests::OneSampleTTest(const core::Sample &sample, double hypothesized_mean,
                                                         double alpha) {
	ValidateAlpha(alpha);
	core::ValidateSample(sample, 2, "one-sample t-test");
	if (!std::isfinite(hypothesized_mean)) {
		throw core::StatisticsError(core::ErrorKind::InvalidParameter, "hypothesized mean must be finite");
	}

	const auto n = static_cast<double>(sample.size());
	const double mean = descriptive::DescriptiveCalculator::Mean(sample);
	const double sd = descriptive::DescriptiveCalculator::StandardDeviation(sample);

	if (sd == 0.0) {
		throw core::StatisticsError(core::ErrorKind::DivisionByZero,
		                            "one-sample t-test is undefined for a sample with zero variance");
	}

	core::TTestResult result;
	result.test_name = "One-sample t-test";
	result.alpha = alpha;
	result.estimate = mean;
	result.standard_error = sd / std::sqrt(n);
	result.degrees_of_freedom = n - 1.0;
	result.t_statistic = (mean - hypothesized_mean) / result.standard_error;
	result.p_value = utils::student_t_pvalue(result.t_statistic, result.degrees_of_freedom);
	result.is_significant = result.p_value < alpha;
	result.effect_size = std::fabs(mean - hypothesized_mean) / sd;
	result.confidence_interval =
	    ComputeConfidenceInterval(mean, result.standard_error, result.degrees_of_freedom, alpha);

	STATENGINE_DEBUG("one-sample t-test: t=" << result.t_statistic << ", df=" << result.degrees_of_freedom
	                                         << ", p=" << result.p_value);

	return result;
}

inline core::TTestResult HypothesisTests::OneSampleTTest(const std::vector<double> &sample, double hypothesized_mean,
                                                         double alpha) {
	return OneSampleTTest(core::ToSample(sample), hypothesized_mean, alpha);
}

inline core::TTestResult HypothesisTests::TwoSampleTTest(const core::Sample &sample_a, const core::Sample &sample_b,
                                                         const core::TestOptions &options) {
	options.Validate();
	const std::string operation = options.equal_variance ? "pooled two-sample t-test" : "Welch two-sample t-test";
	core::ValidateSample(sample_a, 2, operation, "sample_a");
	core::ValidateSample(sample_b, 2, operation, "sample_b");

	const auto n_a = static_cast<double>(sample_a.size());
	const auto n_b = static_cast<double>(sample_b.size());
	const double mean_a = descriptive::DescriptiveCalculator::Mean(sample_a);
	const double mean_b = descriptive::DescriptiveCalculator::Mean(sample_b);
	const double var_a = descriptive::DescriptiveCalculator::Variance(sample_a);
	const double var_b = descriptive::DescriptiveCalculator::Variance(sample_b);

	const double pooled_variance = ((n_a - 1.0) * var_a + (n_b - 1.0) * var_b) / (n_a + n_b - 2.0);

	double standard_error;
	double df;
	if (options.equal_variance) {
		standard_error = std::sqrt(pooled_variance * (1.0 / n_a + 1.0 / n_b));
		df = n_a + n_b - 2.0;
	} else {
		const double se2_a = var_a / n_a;
		const double se2_b = var_b / n_b;
		standard_error = std::sqrt(se2_a + se2_b);
		// Welch-Satterthwaite
		df = (se2_a + se2_b) * (se2_a + se2_b) / (se2_a * se2_a / (n_a - 1.0) + se2_b * se2_b / (n_b - 1.0));
	}

	if (standard_error == 0.0) {
		throw core::StatisticsError(core::ErrorKind::DivisionByZero,
		                            operation + " is undefined when both samples have zero variance");
	}

	const double difference = mean_a - mean_b;

	core::TTestResult result;
	result.test_name = options.equal_variance ? "Two-sample t-test (pooled variance)" : "Welch two-sample t-test";
	result.alpha = options.alpha;
	result.estimate = difference;
	result.standard_error = standard_error;
	result.degrees_of_freedom = df;
	result.t_statistic = difference / standard_error;
	result.p_value = utils::student_t_pvalue(result.t_statistic, df);
	result.is_significant = result.p_value < options.alpha;
	result.effect_size = std::fabs(difference) / std::sqrt(pooled_variance);
	result.confidence_interval = ComputeConfidenceInterval(difference, standard_error, df, options.alpha);

	STATENGINE_DEBUG(result.test_name << ": t=" << result.t_statistic << ", df=" << df << ", p=" << result.p_value
	                                  << ", d=" << result.effect_size);

	return result;
}

inline core::TTestResult HypothesisTests::TwoSampleTTest(const core::Sample &sample_a, const core::Sample &sample_b,
                                                         double alpha) {
	return TwoSampleTTest(sample_a, sample_b, core::TestOptions::Welch(alpha));
}

inline core::TTestResult HypothesisTests::TwoSampleTTest(const std::vector<double> &sample_a,
                                                         const std::vector<double> &sample_b, double alpha) {
	return TwoSampleTTest(core::ToSample(sample_a), core::ToSample(sample_b), core::TestOptions::Welch(alpha));
}

inline core::TTestResult HypothesisTests::PairedTTest(const core::Sample &sample_a, const core::Sample &sample_b,
                                                      double alpha) {
	ValidateAlpha(alpha);
	core::ValidateSample(sample_a, 2, "paired t-test", "sample_a");
	core::ValidateSample(sample_b, 2, "paired t-test", "sample_b");
	ValidateEqualLength(sample_a, sample_b, "paired t-test");

	const core::Sample differences = sample_a - sample_b;

	auto result = OneSampleTTest(differences, 0.0, alpha);
	result.test_name = "Paired t-test";
	return result;
}

inline core::ChiSquareResult HypothesisTests::ChiSquareTest(const core::CountMatrix &table, double alpha) {
	ValidateAlpha(alpha);

	const Eigen::Index rows = table.rows();
	const Eigen::Index cols = table.cols();

	if (rows < 2 || cols < 2) {
		throw core::StatisticsError(core::ErrorKind::InvalidInput,
		                            "chi-square test requires at least 2 rows and 2 columns (got " +
		                                std::to_string(rows) + " x " + std::to_string(cols) + ")");
	}
	if ((table.array() < 0).any()) {
		throw core::StatisticsError(core::ErrorKind::InvalidInput, "chi-square test requires non-negative counts");
	}

	const Eigen::Matrix<int64_t, Eigen::Dynamic, 1> row_totals = table.rowwise().sum();
	const Eigen::Matrix<int64_t, 1, Eigen::Dynamic> col_totals = table.colwise().sum();
	const int64_t grand_total = table.sum();

	if (grand_total == 0) {
		throw core::StatisticsError(core::ErrorKind::DivisionByZero, "chi-square test on a table of all zeros");
	}

	const auto n = static_cast<double>(grand_total);
	Eigen::MatrixXd expected(rows, cols);
	double statistic = 0.0;
	Eigen::Index sparse_cells = 0;

	for (Eigen::Index i = 0; i < rows; i++) {
		for (Eigen::Index j = 0; j < cols; j++) {
			const double e = static_cast<double>(row_totals(i)) * static_cast<double>(col_totals(j)) / n;
			if (e == 0.0) {
				throw core::StatisticsError(core::ErrorKind::DivisionByZero,
				                            "chi-square expected count is zero at cell (" + std::to_string(i) + ", " +
				                                std::to_string(j) + "); row or column total is zero");
			}
			expected(i, j) = e;
			if (e < kChiSquareMinExpected) {
				sparse_cells++;
			}
			const double diff = static_cast<double>(table(i, j)) - e;
			statistic += diff * diff / e;
		}
	}

	if (sparse_cells > 0) {
		STATENGINE_WARN("chi-square test: " << sparse_cells << " of " << rows * cols
		                                    << " cells have an expected count below " << kChiSquareMinExpected
		                                    << "; the chi-square approximation may be inaccurate");
	}

	core::ChiSquareResult result;
	result.alpha = alpha;
	result.chi_square_statistic = statistic;
	result.degrees_of_freedom = static_cast<size_t>((rows - 1) * (cols - 1));
	result.p_value = utils::chi_squared_pvalue(statistic, static_cast<double>(result.degrees_of_freedom));
	result.is_significant = result.p_value < alpha;
	result.expected = expected;
	result.grand_total = grand_total;

	const double min_dim = static_cast<double>(std::min(rows, cols) - 1);
	result.cramers_v = std::min(1.0, std::sqrt(statistic / (n * min_dim)));

	STATENGINE_DEBUG("chi-square test: chi2=" << statistic << ", df=" << result.degrees_of_freedom
	                                          << ", p=" << result.p_value << ", V=" << result.cramers_v);

	return result;
}

inline core::ChiSquareResult HypothesisTests::ChiSquareTest(const std::vector<std::vector<int64_t>> &table,
                                                            double alpha) {
	if (table.size() < 2) {
		throw core::StatisticsError(core::ErrorKind::InvalidInput,
		                            "chi-square test requires at least 2 rows (got " + std::to_string(table.size()) +
		                                ")");
	}

	const size_t cols = table[0].size();
	for (size_t i = 1; i < table.size(); i++) {
		if (table[i].size() != cols) {
			throw core::StatisticsError(core::ErrorKind::InvalidInput,
			                            "chi-square table is not rectangular: row " + std::to_string(i) + " has " +
			                                std::to_string(table[i].size()) + " columns, expected " +
			                                std::to_string(cols));
		}
	}

	core::CountMatrix matrix(static_cast<Eigen::Index>(table.size()), static_cast<Eigen::Index>(cols));
	for (size_t i = 0; i < table.size(); i++) {
		for (size_t j = 0; j < cols; j++) {
			matrix(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = table[i][j];
		}
	}

	return ChiSquareTest(matrix, alpha);
}

inline core::CorrelationResult HypothesisTests::PearsonCorrelationTest(const core::Sample &x, const core::Sample &y,
                                                                       double alpha) {
	ValidateAlpha(alpha);
	core::ValidateSample(x, 3, "Pearson correlation test", "x");
	core::ValidateSample(y, 3, "Pearson correlation test", "y");
	ValidateEqualLength(x, y, "Pearson correlation test");

	const auto n = static_cast<double>(x.size());
	const double mean_x = descriptive::DescriptiveCalculator::Mean(x);
	const double mean_y = descriptive::DescriptiveCalculator::Mean(y);

	const Eigen::ArrayXd dx = x.array() - mean_x;
	const Eigen::ArrayXd dy = y.array() - mean_y;
	const double sxx = dx.square().sum();
	const double syy = dy.square().sum();
	const double sxy = (dx * dy).sum();

	if (sxx == 0.0 || syy == 0.0) {
		throw core::StatisticsError(core::ErrorKind::DivisionByZero,
		                            "Pearson correlation is undefined when a sample has zero variance");
	}

	const double r = std::max(-1.0, std::min(1.0, sxy / std::sqrt(sxx * syy)));

	core::CorrelationResult result;
	result.alpha = alpha;
	result.coefficient = r;
	result.sample_size = static_cast<size_t>(x.size());
	result.degrees_of_freedom = n - 2.0;

	// |r| within rounding of 1 is a perfect linear relationship
	const double one_minus_r2 = 1.0 - r * r;
	const bool perfect = one_minus_r2 <= 4.0 * std::numeric_limits<double>::epsilon();
	if (perfect) {
		result.t_statistic = std::copysign(std::numeric_limits<double>::infinity(), r);
		result.p_value = 0.0;
	} else {
		result.t_statistic = r * std::sqrt(result.degrees_of_freedom / one_minus_r2);
		result.p_value = utils::student_t_pvalue(result.t_statistic, result.degrees_of_freedom);
	}
	result.is_significant = result.p_value < alpha;

	if (result.sample_size >= 4) {
		if (perfect) {
			result.confidence_interval = core::ConfidenceInterval(r, r, 1.0 - alpha);
		} else {
			const double z = std::atanh(r);
			const double half_width = utils::normal_quantile(1.0 - alpha / 2.0) / std::sqrt(n - 3.0);
			result.confidence_interval =
			    core::ConfidenceInterval(std::tanh(z - half_width), std::tanh(z + half_width), 1.0 - alpha);
		}
	}

	STATENGINE_DEBUG("Pearson correlation test: r=" << r << ", t=" << result.t_statistic << ", p=" << result.p_value);

	return result;
}

} // namespace inference
} // namespace libstatengine
