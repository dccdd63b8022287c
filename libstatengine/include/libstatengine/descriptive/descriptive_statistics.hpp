#pragma once

#include "../core/descriptive_result.hpp"
#include "../core/sample.hpp"
#include <Eigen/Dense>
#include <map>
#include <string>
#include <vector>

namespace libstatengine {
namespace descriptive {

/**
 * DescriptiveCalculator: summary statistics of a raw sample
 *
 * This class provides methods to compute:
 * - Location: mean, median, mode
 * - Spread: sample variance (n - 1 divisor), standard deviation, range, IQR
 * - Shape: bias-corrected skewness (G1) and excess kurtosis (G2)
 * - Quartiles by linear interpolation at rank p * (n - 1)
 *
 * Formulas, with central sums M_k = Σ (x_i - mean)^k:
 * - s² = M_2 / (n - 1)
 * - g1 = (M_3 / n) / (M_2 / n)^{3/2},  G1 = sqrt(n(n-1)) / (n-2) * g1
 * - g2 = (M_4 / n) / (M_2 / n)^2 - 3,  G2 = (n-1) / ((n-2)(n-3)) * ((n+1) g2 + 6)
 *
 * Stateless design (all methods are static). Errors are reported as
 * core::StatisticsError.
 */
class DescriptiveCalculator {
public:
	/**
	 * Compute all summary statistics of a sample
	 *
	 * Skewness and kurtosis are left empty for a constant sample, the
	 * coefficient of variation for a zero mean.
	 *
	 * @param sample Sample (n >= 4)
	 * @return Fresh DescriptiveStatistics
	 * @throws StatisticsError EmptyDataset if n == 0, InsufficientSampleSize if
	 *         n < 4 (variance needs 2, skewness 3, kurtosis 4)
	 */
	static core::DescriptiveStatistics Describe(const core::Sample &sample);

	static core::DescriptiveStatistics Describe(const std::vector<double> &sample);

	/**
	 * Describe every group of a keyed collection
	 *
	 * A failing group aborts the call; the rethrown error keeps the original
	 * kind and carries the group key as context.
	 */
	static std::map<std::string, core::DescriptiveStatistics>
	DescribeGrouped(const std::map<std::string, core::Sample> &groups);

	static std::map<std::string, core::DescriptiveStatistics>
	DescribeGrouped(const std::map<std::string, std::vector<double>> &groups);

	/// Arithmetic mean; n >= 1
	static double Mean(const core::Sample &sample);

	/// Sample variance with Bessel's correction; n >= 2
	static double Variance(const core::Sample &sample);

	/// sqrt(Variance); n >= 2
	static double StandardDeviation(const core::Sample &sample);

	/// Conventional median (average of the two middle values for even n); n >= 1
	static double Median(const core::Sample &sample);

	/**
	 * Quantile by linear interpolation at rank p * (n - 1)
	 *
	 * @param p Probability in [0, 1]
	 */
	static double Quantile(const core::Sample &sample, double p);

	/// Q1, Q2, Q3 at ranks 0.25, 0.5, 0.75; n >= 1
	static core::Quartiles ComputeQuartiles(const core::Sample &sample);

	/// Every value attaining the maximum frequency, ascending; n >= 1
	static std::vector<double> Mode(const core::Sample &sample);

	/**
	 * Bias-corrected sample skewness G1
	 *
	 * @throws StatisticsError InsufficientSampleSize if n < 3,
	 *         DivisionByZero if the sample has zero variance
	 */
	static double Skewness(const core::Sample &sample);

	/**
	 * Bias-corrected excess kurtosis G2
	 *
	 * @throws StatisticsError InsufficientSampleSize if n < 4,
	 *         DivisionByZero if the sample has zero variance
	 */
	static double Kurtosis(const core::Sample &sample);

private:
	/// Central sums M_2, M_3, M_4 around the given mean (two-pass)
	struct CentralSums {
		double m2 = 0.0;
		double m3 = 0.0;
		double m4 = 0.0;
	};

	static CentralSums ComputeCentralSums(const core::Sample &sample, double mean);

	static std::vector<double> SortedCopy(const core::Sample &sample);

	static double QuantileFromSorted(const std::vector<double> &sorted, double p);

	static std::vector<double> ModeFromSorted(const std::vector<double> &sorted);

	static double SkewnessFromSums(size_t n, const CentralSums &sums);

	static double KurtosisFromSums(size_t n, const CentralSums &sums);
};

} // namespace descriptive
} // namespace libstatengine

#include "descriptive_statistics_impl.hpp"
