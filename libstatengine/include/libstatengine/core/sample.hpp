#pragma once

#include "errors.hpp"

#include <Eigen/Dense>
#include <cmath>
#include <string>
#include <vector>

namespace libstatengine {
namespace core {

/// An ordered sequence of finite doubles
using Sample = Eigen::VectorXd;

/// Copy a std::vector into a Sample
inline Sample ToSample(const std::vector<double> &values) {
	Sample sample(static_cast<Eigen::Index>(values.size()));
	for (size_t i = 0; i < values.size(); i++) {
		sample(static_cast<Eigen::Index>(i)) = values[i];
	}
	return sample;
}

/**
 * Validate a sample before computing on it
 *
 * @param sample Sample to check
 * @param min_size Minimum number of observations the computation needs
 * @param operation Operation name for error messages
 * @param label Sample label stored as error context ("sample_a", ...)
 * @throws StatisticsError EmptyDataset if empty, InvalidInput on NaN/inf,
 *         InsufficientSampleSize if n < min_size
 */
inline void ValidateSample(const Sample &sample, size_t min_size, const std::string &operation,
                           const std::string &label = "") {
	const auto n = static_cast<size_t>(sample.size());
	const std::string where = label.empty() ? operation : operation + " (" + label + ")";

	if (n == 0) {
		throw StatisticsError(ErrorKind::EmptyDataset, where + ": sample is empty", label);
	}

	for (Eigen::Index i = 0; i < sample.size(); i++) {
		if (!std::isfinite(sample(i))) {
			throw StatisticsError(ErrorKind::InvalidInput,
			                      where + ": non-finite value at index " + std::to_string(i), label);
		}
	}

	if (n < min_size) {
		throw StatisticsError(ErrorKind::InsufficientSampleSize,
		                      where + " requires at least " + std::to_string(min_size) + " observations, got " +
		                          std::to_string(n),
		                      label);
	}
}

} // namespace core
} // namespace libstatengine
