#include <catch2/catch_test_macros.hpp>

#include "seriesfeat/core/dense_array.hpp"
#include "common/panel_fixtures.hpp"

#include <cstddef>
#include <limits>
#include <stdexcept>
#include <vector>

using seriesfeat::core::DenseArray;
using tests::fixtures::makePanel;

TEST_CASE("DenseArray rejects value counts that do not match the shape", "[core][dense_array]") {
	REQUIRE_THROWS_AS(DenseArray({2, 3}, std::vector<double>(5, 0.0)), std::invalid_argument);
	REQUIRE_NOTHROW(DenseArray({2, 3}, std::vector<double>(6, 0.0)));
	REQUIRE_NOTHROW(DenseArray({0, 1, 10}, {}));
}

TEST_CASE("DenseArray rejects shapes whose element count overflows", "[core][dense_array]") {
	const auto huge = std::size_t{1} << (std::numeric_limits<std::size_t>::digits - 1);
	REQUIRE_THROWS_AS(DenseArray({huge, 2, 1}, {}), std::invalid_argument);
	REQUIRE_THROWS_AS(DenseArray::zeros({huge, huge}), std::invalid_argument);

	// A zero extent makes the array empty whatever the other extents are.
	REQUIRE_NOTHROW(DenseArray({huge, 4, 0}, {}));
}

TEST_CASE("DenseArray reports rank and shape", "[core][dense_array]") {
	const auto panel = makePanel(5, 2, 10);
	REQUIRE(panel.rank() == 3);
	REQUIRE(panel.size() == 100);
	REQUIRE(panel.shapeString() == "(5, 2, 10)");

	const auto vector = DenseArray::fromVector({1.0, 2.0, 3.0});
	REQUIRE(vector.rank() == 1);
	REQUIRE(vector.shape() == DenseArray::Shape{3});
	REQUIRE(vector.at(2) == 3.0);

	const DenseArray empty;
	REQUIRE(empty.rank() == 1);
	REQUIRE(empty.empty());
}

TEST_CASE("DenseArray element access is row-major", "[core][dense_array]") {
	const auto panel = makePanel(3, 2, 4);
	REQUIRE(panel.at(2, 1, 3) == 213.0);
	REQUIRE(panel.values()[(2 * 2 + 1) * 4 + 3] == 213.0);

	REQUIRE_THROWS_AS(panel.at(3, 0, 0), std::out_of_range);
	REQUIRE_THROWS_AS(panel.at(0), std::logic_error);
	REQUIRE_THROWS_AS(DenseArray::fromVector({1.0}).at(0, 0, 0), std::logic_error);
}

TEST_CASE("DenseArray exposes instances as Eigen matrices", "[core][dense_array]") {
	const auto panel = makePanel(3, 2, 4);
	const auto view = panel.instance(1);
	REQUIRE(view.rows() == 2);
	REQUIRE(view.cols() == 4);
	REQUIRE(view(0, 0) == 100.0);
	REQUIRE(view(1, 3) == 113.0);
	REQUIRE(view.row(1).sum() == 110.0 + 111.0 + 112.0 + 113.0);

	REQUIRE_THROWS_AS(panel.instance(3), std::out_of_range);
	REQUIRE_THROWS_AS(DenseArray::fromVector({1.0}).instance(0), std::logic_error);
}

TEST_CASE("DenseArray equality compares shape and values", "[core][dense_array]") {
	REQUIRE(makePanel(2, 1, 3) == makePanel(2, 1, 3));
	REQUIRE(makePanel(2, 1, 3) != makePanel(1, 2, 3));
	REQUIRE(DenseArray({6}, std::vector<double>(6, 1.0)) != DenseArray({2, 3}, std::vector<double>(6, 1.0)));
}
