#pragma once

#include "../core/descriptive_result.hpp"
#include "../core/errors.hpp"
#include "../core/inference_result.hpp"
#include <nlohmann/json.hpp>
#include <optional>

namespace libstatengine {
namespace core {

/**
 * JSON export of result structs
 *
 * nlohmann::json finds these overloads by argument-dependent lookup, so a
 * plain `nlohmann::json j = result;` works for every result type. Keys are the
 * struct field names; absent optionals are written as null and non-finite
 * doubles (an infinite Pearson t) follow nlohmann's null convention.
 */

namespace detail {

template <typename T>
inline nlohmann::json OptionalToJson(const std::optional<T> &value) {
	if (!value) {
		return nullptr;
	}
	return nlohmann::json(*value);
}

} // namespace detail

inline void to_json(nlohmann::json &j, const ConfidenceInterval &ci) {
	j = nlohmann::json {{"lower_bound", ci.lower_bound},
	                    {"upper_bound", ci.upper_bound},
	                    {"confidence_level", ci.confidence_level}};
}

inline void to_json(nlohmann::json &j, const Quartiles &q) {
	j = nlohmann::json {{"q1", q.q1}, {"q2", q.q2}, {"q3", q.q3}};
}

inline void to_json(nlohmann::json &j, const DescriptiveStatistics &stats) {
	j = nlohmann::json {{"count", stats.count},
	                    {"sum", stats.sum},
	                    {"mean", stats.mean},
	                    {"median", stats.median},
	                    {"mode", stats.mode},
	                    {"variance", stats.variance},
	                    {"standard_deviation", stats.standard_deviation},
	                    {"min", stats.min},
	                    {"max", stats.max},
	                    {"range", stats.range},
	                    {"quartiles", stats.quartiles},
	                    {"interquartile_range", stats.interquartile_range},
	                    {"skewness", detail::OptionalToJson(stats.skewness)},
	                    {"kurtosis", detail::OptionalToJson(stats.kurtosis)},
	                    {"coefficient_of_variation", detail::OptionalToJson(stats.coefficient_of_variation)}};
}

inline void to_json(nlohmann::json &j, const TTestResult &result) {
	j = nlohmann::json {{"test_name", result.test_name},
	                    {"t_statistic", result.t_statistic},
	                    {"p_value", result.p_value},
	                    {"degrees_of_freedom", result.degrees_of_freedom},
	                    {"is_significant", result.is_significant},
	                    {"estimate", result.estimate},
	                    {"standard_error", result.standard_error},
	                    {"confidence_interval", result.confidence_interval},
	                    {"effect_size", result.effect_size},
	                    {"alpha", result.alpha}};
}

inline void to_json(nlohmann::json &j, const ChiSquareResult &result) {
	// Expected counts as row-major nested arrays
	nlohmann::json expected = nlohmann::json::array();
	for (Eigen::Index i = 0; i < result.expected.rows(); i++) {
		nlohmann::json row = nlohmann::json::array();
		for (Eigen::Index k = 0; k < result.expected.cols(); k++) {
			row.push_back(result.expected(i, k));
		}
		expected.push_back(row);
	}

	j = nlohmann::json {{"chi_square_statistic", result.chi_square_statistic},
	                    {"p_value", result.p_value},
	                    {"degrees_of_freedom", result.degrees_of_freedom},
	                    {"is_significant", result.is_significant},
	                    {"cramers_v", result.cramers_v},
	                    {"expected", expected},
	                    {"grand_total", result.grand_total},
	                    {"alpha", result.alpha}};
}

inline void to_json(nlohmann::json &j, const NormalityTestResult &result) {
	j = nlohmann::json {{"test_name", result.test_name},     {"statistic", result.statistic},
	                    {"p_value", result.p_value},         {"is_normal", result.is_normal},
	                    {"sample_size", result.sample_size}, {"alpha", result.alpha}};
}

inline void to_json(nlohmann::json &j, const CorrelationResult &result) {
	j = nlohmann::json {{"coefficient", result.coefficient},
	                    {"t_statistic", result.t_statistic},
	                    {"p_value", result.p_value},
	                    {"degrees_of_freedom", result.degrees_of_freedom},
	                    {"is_significant", result.is_significant},
	                    {"confidence_interval", detail::OptionalToJson(result.confidence_interval)},
	                    {"sample_size", result.sample_size},
	                    {"alpha", result.alpha}};
}

inline void to_json(nlohmann::json &j, const StatisticsError &error) {
	j = nlohmann::json {{"kind", ErrorKindName(error.kind())}, {"message", error.what()}};
	j["context"] = error.context().empty() ? nlohmann::json(nullptr) : nlohmann::json(error.context());
}

} // namespace core
} // namespace libstatengine
