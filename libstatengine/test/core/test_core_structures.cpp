#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <libstatengine/core/descriptive_result.hpp>
#include <libstatengine/core/errors.hpp>
#include <libstatengine/core/inference_result.hpp>
#include <libstatengine/core/sample.hpp>
#include <libstatengine/core/test_options.hpp>
#include <cmath>
#include <string>
#include <vector>

using namespace libstatengine;
using namespace libstatengine::core;

const double TOLERANCE = 1e-10;

TEST_CASE("Core Structures: TestOptions - Default Values", "[core][options]") {
	TestOptions opts;

	REQUIRE(opts.alpha == 0.05);
	REQUIRE_FALSE(opts.equal_variance);
	REQUIRE_THAT(opts.confidence_level(), Catch::Matchers::WithinAbs(0.95, TOLERANCE));
	REQUIRE_NOTHROW(opts.Validate());
}

TEST_CASE("Core Structures: TestOptions - Convenience Constructors", "[core][options]") {
	SECTION("Welch") {
		auto opts = TestOptions::Welch(0.01);
		REQUIRE(opts.alpha == 0.01);
		REQUIRE_FALSE(opts.equal_variance);
		REQUIRE_THAT(opts.confidence_level(), Catch::Matchers::WithinAbs(0.99, TOLERANCE));
	}

	SECTION("Pooled") {
		auto opts = TestOptions::Pooled();
		REQUIRE(opts.alpha == 0.05);
		REQUIRE(opts.equal_variance);
	}
}

TEST_CASE("Core Structures: TestOptions - Validation", "[core][options][validation]") {
	TestOptions opts;

	for (double bad : {0.0, 1.0, -0.1, 1.5, std::nan("")}) {
		opts.alpha = bad;
		REQUIRE_THROWS_AS(opts.Validate(), StatisticsError);
		REQUIRE_THROWS_AS(opts.Validate(), std::invalid_argument);
	}

	opts.alpha = 0.1;
	REQUIRE_NOTHROW(opts.Validate());
}

TEST_CASE("Core Structures: ConfidenceInterval", "[core][ci]") {
	ConfidenceInterval ci(1.5, 4.5, 0.95);

	REQUIRE(ci.lower_bound == 1.5);
	REQUIRE(ci.upper_bound == 4.5);
	REQUIRE(ci.confidence_level == 0.95);
	REQUIRE_THAT(ci.width(), Catch::Matchers::WithinAbs(3.0, TOLERANCE));

	REQUIRE(ci.Contains(1.5));
	REQUIRE(ci.Contains(3.0));
	REQUIRE(ci.Contains(4.5));
	REQUIRE_FALSE(ci.Contains(1.49));
	REQUIRE_FALSE(ci.Contains(4.51));
}

TEST_CASE("Core Structures: Quartiles", "[core][descriptive]") {
	Quartiles q;
	q.q1 = 2.0;
	q.q2 = 3.5;
	q.q3 = 6.25;

	REQUIRE_THAT(q.interquartile_range(), Catch::Matchers::WithinAbs(4.25, TOLERANCE));
}

TEST_CASE("Core Structures: Result Defaults", "[core][inference]") {
	TTestResult t;
	REQUIRE(t.p_value == 1.0);
	REQUIRE_FALSE(t.is_significant);
	REQUIRE(t.alpha == 0.05);

	ChiSquareResult chi;
	REQUIRE(chi.degrees_of_freedom == 0);
	REQUIRE(chi.expected.size() == 0);

	NormalityTestResult normality;
	REQUIRE(normality.is_normal);

	CorrelationResult correlation;
	REQUIRE_FALSE(correlation.confidence_interval.has_value());

	DescriptiveStatistics stats;
	REQUIRE_FALSE(stats.skewness.has_value());
	REQUIRE_FALSE(stats.kurtosis.has_value());
	REQUIRE_FALSE(stats.coefficient_of_variation.has_value());
	REQUIRE(stats.mode.empty());
}

TEST_CASE("Core Structures: StatisticsError", "[core][errors]") {
	StatisticsError error(ErrorKind::InsufficientSampleSize, "variance requires at least 2 observations");

	REQUIRE(error.kind() == ErrorKind::InsufficientSampleSize);
	REQUIRE(error.context().empty());
	REQUIRE(std::string(error.what()) == "variance requires at least 2 observations");

	SECTION("WithContext keeps the kind and prefixes the message") {
		auto grouped = error.WithContext("control");
		REQUIRE(grouped.kind() == ErrorKind::InsufficientSampleSize);
		REQUIRE(grouped.context() == "control");
		REQUIRE(std::string(grouped.what()) == "group 'control': variance requires at least 2 observations");
	}

	SECTION("Catchable as std::invalid_argument") {
		REQUIRE_THROWS_AS(throw error, std::invalid_argument);
	}
}

TEST_CASE("Core Structures: ErrorKind Names", "[core][errors]") {
	REQUIRE(std::string(ErrorKindName(ErrorKind::EmptyDataset)) == "EmptyDataset");
	REQUIRE(std::string(ErrorKindName(ErrorKind::InsufficientSampleSize)) == "InsufficientSampleSize");
	REQUIRE(std::string(ErrorKindName(ErrorKind::InvalidSampleSize)) == "InvalidSampleSize");
	REQUIRE(std::string(ErrorKindName(ErrorKind::InvalidInput)) == "InvalidInput");
	REQUIRE(std::string(ErrorKindName(ErrorKind::InvalidParameter)) == "InvalidParameter");
	REQUIRE(std::string(ErrorKindName(ErrorKind::DivisionByZero)) == "DivisionByZero");
	REQUIRE(std::string(ErrorKindName(ErrorKind::ConvergenceFailure)) == "ConvergenceFailure");
}

TEST_CASE("Core Structures: ToSample", "[core][sample]") {
	std::vector<double> values = {3.0, -1.5, 2.25};
	Sample sample = ToSample(values);

	REQUIRE(sample.size() == 3);
	REQUIRE(sample(0) == 3.0);
	REQUIRE(sample(1) == -1.5);
	REQUIRE(sample(2) == 2.25);

	REQUIRE(ToSample(std::vector<double>()).size() == 0);
}
