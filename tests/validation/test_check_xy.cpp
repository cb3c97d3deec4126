#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "seriesfeat/errors.hpp"
#include "seriesfeat/validation.hpp"
#include "common/panel_fixtures.hpp"

#include <variant>

using Catch::Matchers::ContainsSubstring;
using namespace seriesfeat;
using namespace tests::fixtures;
using validation::checkXY;
using validation::CheckXYOptions;

TEST_CASE("checkXY returns a consistent pair unchanged", "[validation][check_xy]") {
	const auto X = makePanel(5, 1, 10);
	const auto y = makeLabels(5);

	const auto pair = checkXY(X, y);
	REQUIRE(std::get<core::DenseArray>(pair.X) == X);
	REQUIRE(std::get<core::Series>(pair.y) == y);
}

TEST_CASE("checkXY accepts a dense target of matching length", "[validation][check_xy]") {
	const auto X = makePanel(5, 1, 10);
	const auto y = core::DenseArray::fromVector({0.0, 1.0, 1.0, 0.0, 1.0});

	const auto pair = checkXY(X, y);
	REQUIRE(std::holds_alternative<core::DenseArray>(pair.y));
	REQUIRE(std::get<core::DenseArray>(pair.y) == y);
	REQUIRE(std::get<core::DenseArray>(pair.X) == X);
}

TEST_CASE("checkXY never converts nested features", "[validation][check_xy]") {
	const auto X = makeNestedTable(4, 2, 3);
	const auto pair = checkXY(X, makeLabels(4));
	REQUIRE(std::holds_alternative<core::NestedTable>(pair.X));
}

TEST_CASE("checkXY rejects pairs with different instance counts", "[validation][check_xy]") {
	REQUIRE_THROWS_AS(checkXY(makePanel(5, 1, 10), makeLabels(4)), InconsistentLengthError);
	REQUIRE_THROWS_AS(checkXY(makeNestedTable(3, 1, 10), makeLabels(6)), InconsistentLengthError);
	REQUIRE_THROWS_AS(checkXY(makePanel(2, 1, 10), core::DenseArray::fromVector({1.0, 0.0, 1.0})),
	                  InconsistentLengthError);
	REQUIRE_THROWS_WITH(checkXY(makePanel(5, 1, 10), makeLabels(4)), ContainsSubstring("[5, 4]"));
}

TEST_CASE("checkXY forwards options to the feature check", "[validation][check_xy]") {
	REQUIRE_THROWS_AS(checkXY(makePanel(5, 2, 10), makeLabels(5), true), InvalidShapeError);
	REQUIRE_THROWS_WITH(checkXY(makePanel(5, 2, 10), makeLabels(5), true), ContainsSubstring("found: 2"));

	CheckXYOptions options;
	options.enforce_min_columns = 3;
	REQUIRE_THROWS_AS(checkXY(makePanel(5, 2, 10), makeLabels(5), options), InvalidShapeError);

	options.enforce_min_columns = 1;
	options.enforce_min_instances = 6;
	REQUIRE_THROWS_AS(checkXY(makePanel(5, 2, 10), makeLabels(5), options), InvalidShapeError);
}

TEST_CASE("checkXY validates each side on its own", "[validation][check_xy]") {
	REQUIRE_THROWS_AS(checkXY(makeLabels(5), makeLabels(5)), InvalidTypeError);
	REQUIRE_THROWS_AS(checkXY(makePanel(5, 1, 10), makeNestedTable(5, 1, 10)), InvalidTypeError);
	REQUIRE_THROWS_AS(checkXY(makeFlatTable(5, 1), makeLabels(5)), InvalidStructureError);
}

TEST_CASE("checkXY checks the target minimum with its own default", "[validation][check_xy]") {
	// Disabling the feature minimum still leaves the target requiring one instance.
	REQUIRE_THROWS_AS(checkXY(core::DenseArray::zeros({0, 1, 4}), core::Series{}, false, 0), InvalidShapeError);
}
