#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace libstatengine {
namespace core {

/**
 * Quartiles from linear interpolation between order statistics
 * at fractional ranks 0.25, 0.5 and 0.75 of (n - 1)
 */
struct Quartiles {
	double q1 = 0.0;
	double q2 = 0.0;
	double q3 = 0.0;

	double interquartile_range() const {
		return q3 - q1;
	}
};

/**
 * Summary statistics of a single sample
 *
 * Produced fresh by DescriptiveCalculator::Describe and never mutated
 * afterwards.
 *
 * Design notes:
 * - variance is the sample variance (n - 1 divisor)
 * - Higher moments are optional: they are absent (not NaN) when the sample
 *   has zero variance
 * - coefficient_of_variation is absent when the mean is zero
 */
struct DescriptiveStatistics {
	size_t count = 0;
	double sum = 0.0;
	double mean = 0.0;
	double median = 0.0;

	/// Every value attaining the maximum frequency, sorted ascending
	std::vector<double> mode;

	double variance = 0.0;
	double standard_deviation = 0.0;
	double min = 0.0;
	double max = 0.0;
	double range = 0.0;

	Quartiles quartiles;
	double interquartile_range = 0.0;

	/// Bias-corrected sample skewness (G1); requires n >= 3 and variance > 0
	std::optional<double> skewness;

	/// Bias-corrected excess kurtosis (G2); requires n >= 4 and variance > 0
	std::optional<double> kurtosis;

	/// standard_deviation / mean; absent when mean == 0
	std::optional<double> coefficient_of_variation;
};

} // namespace core
} // namespace libstatengine
