#pragma once

#include "normality_test.hpp"
#include "../core/test_options.hpp"
#include "../utils/distributions.hpp"
#include "../utils/tracing.hpp"
#include <algorithm>
#include <cmath>

namespace libstatengine {
namespace diagnostics {

// Implementation of NormalityTester methods

template <size_t N>
inline double NormalityTester::Polynomial(const double (&coefficients)[N], double x) {
	double result = 0.0;
	for (size_t k = N; k-- > 0;) {
		result = result * x + coefficients[k];
	}
	return result;
}

inline std::vector<double> NormalityTester::ShapiroWilkCoefficients(size_t n) {
	if (n < kShapiroWilkMinSize || n > kShapiroWilkMaxSize) {
		throw core::StatisticsError(core::ErrorKind::InvalidSampleSize,
		                            "Shapiro-Wilk coefficients need 3 <= n <= 5000 (got " + std::to_string(n) + ")");
	}

	const size_t half = n / 2;
	std::vector<double> a(half);

	if (n == 3) {
		a[0] = std::sqrt(0.5);
		return a;
	}

	static constexpr double c1[6] = {0.0, 0.221157, -0.147981, -2.07119, 4.434685, -2.706056};
	static constexpr double c2[6] = {0.0, 0.042981, -0.293762, -1.752461, 5.682633, -3.582633};

	const auto nd = static_cast<double>(n);

	// Expected normal order statistics of the upper half, largest first
	std::vector<double> m(half);
	double mm = 0.0;
	for (size_t i = 0; i < half; i++) {
		m[i] = -utils::normal_quantile((static_cast<double>(i + 1) - 0.375) / (nd + 0.25));
		mm += m[i] * m[i];
	}
	mm *= 2.0;

	const double u = 1.0 / std::sqrt(nd);
	const double root_mm = std::sqrt(mm);

	const double a_n = Polynomial(c1, u) + m[0] / root_mm;
	a[0] = a_n;

	size_t first_scaled;
	double phi;
	if (n > 5) {
		const double a_n1 = Polynomial(c2, u) + m[1] / root_mm;
		a[1] = a_n1;
		phi = (mm - 2.0 * m[0] * m[0] - 2.0 * m[1] * m[1]) / (1.0 - 2.0 * a_n * a_n - 2.0 * a_n1 * a_n1);
		first_scaled = 2;
	} else {
		phi = (mm - 2.0 * m[0] * m[0]) / (1.0 - 2.0 * a_n * a_n);
		first_scaled = 1;
	}

	const double root_phi = std::sqrt(phi);
	for (size_t i = first_scaled; i < half; i++) {
		a[i] = m[i] / root_phi;
	}

	return a;
}

inline double NormalityTester::ShapiroWilkPValue(double w, size_t n) {
	if (n == 3) {
		// Exact: (6/π)(asin(sqrt(W)) - asin(sqrt(3/4)))
		const double p = 6.0 / utils::detail::kPi * (std::asin(std::sqrt(w)) - utils::detail::kPi / 3.0);
		return std::max(0.0, std::min(1.0, p));
	}

	const auto nd = static_cast<double>(n);
	double y = std::log(std::max(0.0, 1.0 - w));
	double mean;
	double sd;

	if (n <= 11) {
		static constexpr double c3[4] = {0.544, -0.39978, 0.025054, -6.714e-4};
		static constexpr double c4[4] = {1.3822, -0.77857, 0.062767, -0.0020322};

		const double gamma = -2.273 + 0.459 * nd;
		if (y >= gamma) {
			return 1e-99;
		}
		y = -std::log(gamma - y);
		mean = Polynomial(c3, nd);
		sd = std::exp(Polynomial(c4, nd));
	} else {
		static constexpr double c5[4] = {-1.5861, -0.31082, -0.083751, 0.0038915};
		static constexpr double c6[3] = {-0.4803, -0.082676, 0.0030302};

		const double log_n = std::log(nd);
		mean = Polynomial(c5, log_n);
		sd = std::exp(Polynomial(c6, log_n));
	}

	// Upper tail of N(mean, sd)
	return utils::normal_cdf(-(y - mean) / sd);
}

inline core::NormalityTestResult NormalityTester::ShapiroWilk(const core::Sample &sample, double alpha) {
	core::TestOptions options;
	options.alpha = alpha;
	options.Validate();

	const auto n = static_cast<size_t>(sample.size());
	if (n < kShapiroWilkMinSize || n > kShapiroWilkMaxSize) {
		throw core::StatisticsError(core::ErrorKind::InvalidSampleSize,
		                            "Shapiro-Wilk test requires 3 <= n <= 5000 (got " + std::to_string(n) + ")");
	}
	core::ValidateSample(sample, kShapiroWilkMinSize, "Shapiro-Wilk test");

	STATENGINE_TIMING_START();

	std::vector<double> sorted(sample.data(), sample.data() + sample.size());
	std::sort(sorted.begin(), sorted.end());

	if (sorted.back() - sorted.front() == 0.0) {
		throw core::StatisticsError(core::ErrorKind::DivisionByZero,
		                            "Shapiro-Wilk test is undefined for a sample with zero range");
	}

	const auto a = ShapiroWilkCoefficients(n);

	const double mean = sample.mean();
	const double ss = (sample.array() - mean).square().sum();

	double numerator = 0.0;
	for (size_t i = 0; i < a.size(); i++) {
		numerator += a[i] * (sorted[n - 1 - i] - sorted[i]);
	}

	// Σ a_i² = 1 bounds W by 1 up to rounding
	const double w = std::min(1.0, numerator * numerator / ss);

	core::NormalityTestResult result;
	result.test_name = "Shapiro-Wilk";
	result.alpha = alpha;
	result.sample_size = n;
	result.statistic = w;
	result.p_value = ShapiroWilkPValue(w, n);
	result.is_normal = result.p_value > alpha;

	STATENGINE_DEBUG("Shapiro-Wilk: n=" << n << ", W=" << w << ", p=" << result.p_value);
	STATENGINE_TIMING_END("Shapiro-Wilk");

	return result;
}

inline core::NormalityTestResult NormalityTester::ShapiroWilk(const std::vector<double> &sample, double alpha) {
	return ShapiroWilk(core::ToSample(sample), alpha);
}

inline core::NormalityTestResult NormalityTester::JarqueBera(const core::Sample &sample, double alpha) {
	core::TestOptions options;
	options.alpha = alpha;
	options.Validate();
	core::ValidateSample(sample, 4, "Jarque-Bera test");

	const auto n = static_cast<double>(sample.size());
	const double mean = sample.mean();

	// Population central moments
	const Eigen::ArrayXd dev = sample.array() - mean;
	const double m2 = dev.square().sum() / n;
	const double m3 = dev.cube().sum() / n;
	const double m4 = dev.square().square().sum() / n;

	if (m2 == 0.0) {
		throw core::StatisticsError(core::ErrorKind::DivisionByZero,
		                            "Jarque-Bera test is undefined for a sample with zero variance");
	}

	// Skewness: E[(X - μ)³] / σ³
	const double skewness = m3 / std::pow(m2, 1.5);

	// Kurtosis: E[(X - μ)⁴] / σ⁴
	const double kurtosis = m4 / (m2 * m2);

	const double excess = kurtosis - 3.0;
	const double jb = (n / 6.0) * (skewness * skewness + 0.25 * excess * excess);

	core::NormalityTestResult result;
	result.test_name = "Jarque-Bera";
	result.alpha = alpha;
	result.sample_size = static_cast<size_t>(sample.size());
	result.statistic = jb;
	result.p_value = utils::chi_squared_pvalue(jb, 2.0);
	result.is_normal = result.p_value > alpha;

	STATENGINE_DEBUG("Jarque-Bera: JB=" << jb << ", p=" << result.p_value << ", skew=" << skewness
	                                    << ", kurt=" << kurtosis);

	return result;
}

} // namespace diagnostics
} // namespace libstatengine
