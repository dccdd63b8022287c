#pragma once

#include "descriptive_statistics.hpp"
#include "../utils/tracing.hpp"
#include <algorithm>
#include <cmath>

namespace libstatengine {
namespace descriptive {

// Implementation of DescriptiveCalculator methods

inline std::vector<double> DescriptiveCalculator::SortedCopy(const core::Sample &sample) {
	std::vector<double> sorted(sample.data(), sample.data() + sample.size());
	std::sort(sorted.begin(), sorted.end());
	return sorted;
}

inline DescriptiveCalculator::CentralSums DescriptiveCalculator::ComputeCentralSums(const core::Sample &sample,
                                                                                    double mean) {
	CentralSums sums;
	for (Eigen::Index i = 0; i < sample.size(); i++) {
		const double dev = sample(i) - mean;
		const double dev2 = dev * dev;
		sums.m2 += dev2;
		sums.m3 += dev2 * dev;
		sums.m4 += dev2 * dev2;
	}
	return sums;
}

inline double DescriptiveCalculator::QuantileFromSorted(const std::vector<double> &sorted, double p) {
	const size_t n = sorted.size();
	if (n == 1) {
		return sorted[0];
	}

	const double rank = p * static_cast<double>(n - 1);
	const auto lo = static_cast<size_t>(std::floor(rank));
	const auto hi = std::min(lo + 1, n - 1);
	const double frac = rank - static_cast<double>(lo);

	return sorted[lo] + frac * (sorted[hi] - sorted[lo]);
}

inline std::vector<double> DescriptiveCalculator::ModeFromSorted(const std::vector<double> &sorted) {
	std::vector<double> modes;
	size_t best_count = 0;

	size_t run_start = 0;
	while (run_start < sorted.size()) {
		size_t run_end = run_start + 1;
		while (run_end < sorted.size() && sorted[run_end] == sorted[run_start]) {
			run_end++;
		}

		const size_t count = run_end - run_start;
		if (count > best_count) {
			best_count = count;
			modes.clear();
			modes.push_back(sorted[run_start]);
		} else if (count == best_count) {
			modes.push_back(sorted[run_start]);
		}

		run_start = run_end;
	}

	return modes;
}

inline double DescriptiveCalculator::SkewnessFromSums(size_t n, const CentralSums &sums) {
	const auto nd = static_cast<double>(n);
	const double m2 = sums.m2 / nd;
	const double m3 = sums.m3 / nd;
	const double g1 = m3 / std::pow(m2, 1.5);
	return std::sqrt(nd * (nd - 1.0)) / (nd - 2.0) * g1;
}

inline double DescriptiveCalculator::KurtosisFromSums(size_t n, const CentralSums &sums) {
	const auto nd = static_cast<double>(n);
	const double m2 = sums.m2 / nd;
	const double m4 = sums.m4 / nd;
	const double g2 = m4 / (m2 * m2) - 3.0;
	return (nd - 1.0) / ((nd - 2.0) * (nd - 3.0)) * ((nd + 1.0) * g2 + 6.0);
}

inline double DescriptiveCalculator::Mean(const core::Sample &sample) {
	core::ValidateSample(sample, 1, "mean");
	return sample.sum() / static_cast<double>(sample.size());
}

inline double DescriptiveCalculator::Variance(const core::Sample &sample) {
	core::ValidateSample(sample, 2, "variance");
	const double mean = sample.sum() / static_cast<double>(sample.size());
	const double m2 = (sample.array() - mean).square().sum();
	return m2 / static_cast<double>(sample.size() - 1);
}

inline double DescriptiveCalculator::StandardDeviation(const core::Sample &sample) {
	return std::sqrt(Variance(sample));
}

inline double DescriptiveCalculator::Median(const core::Sample &sample) {
	core::ValidateSample(sample, 1, "median");
	return QuantileFromSorted(SortedCopy(sample), 0.5);
}

inline double DescriptiveCalculator::Quantile(const core::Sample &sample, double p) {
	core::ValidateSample(sample, 1, "quantile");
	if (!(p >= 0.0 && p <= 1.0)) {
		throw core::StatisticsError(core::ErrorKind::InvalidParameter,
		                            "quantile probability must be in [0, 1] (got " + std::to_string(p) + ")");
	}
	return QuantileFromSorted(SortedCopy(sample), p);
}

inline core::Quartiles DescriptiveCalculator::ComputeQuartiles(const core::Sample &sample) {
	core::ValidateSample(sample, 1, "quartiles");
	const auto sorted = SortedCopy(sample);

	core::Quartiles quartiles;
	quartiles.q1 = QuantileFromSorted(sorted, 0.25);
	quartiles.q2 = QuantileFromSorted(sorted, 0.5);
	quartiles.q3 = QuantileFromSorted(sorted, 0.75);
	return quartiles;
}

inline std::vector<double> DescriptiveCalculator::Mode(const core::Sample &sample) {
	core::ValidateSample(sample, 1, "mode");
	return ModeFromSorted(SortedCopy(sample));
}

inline double DescriptiveCalculator::Skewness(const core::Sample &sample) {
	core::ValidateSample(sample, 3, "skewness");
	const auto n = static_cast<size_t>(sample.size());
	const double mean = sample.sum() / static_cast<double>(n);
	const auto sums = ComputeCentralSums(sample, mean);

	if (sums.m2 == 0.0) {
		throw core::StatisticsError(core::ErrorKind::DivisionByZero, "skewness is undefined for zero variance");
	}
	return SkewnessFromSums(n, sums);
}

inline double DescriptiveCalculator::Kurtosis(const core::Sample &sample) {
	core::ValidateSample(sample, 4, "kurtosis");
	const auto n = static_cast<size_t>(sample.size());
	const double mean = sample.sum() / static_cast<double>(n);
	const auto sums = ComputeCentralSums(sample, mean);

	if (sums.m2 == 0.0) {
		throw core::StatisticsError(core::ErrorKind::DivisionByZero, "kurtosis is undefined for zero variance");
	}
	return KurtosisFromSums(n, sums);
}

inline core::DescriptiveStatistics DescriptiveCalculator::Describe(const core::Sample &sample) {
	// Kurtosis is part of the summary: n >= 4
	core::ValidateSample(sample, 4, "describe");

	const auto n = static_cast<size_t>(sample.size());
	const auto sorted = SortedCopy(sample);

	core::DescriptiveStatistics stats;
	stats.count = n;
	stats.sum = sample.sum();
	stats.mean = stats.sum / static_cast<double>(n);

	const auto sums = ComputeCentralSums(sample, stats.mean);
	stats.variance = sums.m2 / static_cast<double>(n - 1);
	stats.standard_deviation = std::sqrt(stats.variance);

	stats.min = sorted.front();
	stats.max = sorted.back();
	stats.range = stats.max - stats.min;

	stats.quartiles.q1 = QuantileFromSorted(sorted, 0.25);
	stats.quartiles.q2 = QuantileFromSorted(sorted, 0.5);
	stats.quartiles.q3 = QuantileFromSorted(sorted, 0.75);
	stats.median = stats.quartiles.q2;
	stats.interquartile_range = stats.quartiles.interquartile_range();

	stats.mode = ModeFromSorted(sorted);

	// Higher moments are undefined for constant samples
	if (sums.m2 > 0.0) {
		stats.skewness = SkewnessFromSums(n, sums);
		stats.kurtosis = KurtosisFromSums(n, sums);
	}

	if (stats.mean != 0.0) {
		stats.coefficient_of_variation = stats.standard_deviation / stats.mean;
	}

	STATENGINE_DEBUG("describe: n=" << n << ", mean=" << stats.mean << ", sd=" << stats.standard_deviation
	                                << ", median=" << stats.median);

	return stats;
}

inline core::DescriptiveStatistics DescriptiveCalculator::Describe(const std::vector<double> &sample) {
	return Describe(core::ToSample(sample));
}

inline std::map<std::string, core::DescriptiveStatistics>
DescriptiveCalculator::DescribeGrouped(const std::map<std::string, core::Sample> &groups) {
	STATENGINE_INFO("Describing " << groups.size() << " groups");
	std::map<std::string, core::DescriptiveStatistics> results;

	for (const auto &group : groups) {
		try {
			results.emplace(group.first, Describe(group.second));
		} catch (const core::StatisticsError &e) {
			throw e.WithContext(group.first);
		}
	}

	STATENGINE_INFO("Grouped describe completed: " << results.size() << " groups");
	return results;
}

inline std::map<std::string, core::DescriptiveStatistics>
DescriptiveCalculator::DescribeGrouped(const std::map<std::string, std::vector<double>> &groups) {
	std::map<std::string, core::Sample> converted;
	for (const auto &group : groups) {
		converted.emplace(group.first, core::ToSample(group.second));
	}
	return DescribeGrouped(converted);
}

} // namespace descriptive
} // namespace libstatengine
