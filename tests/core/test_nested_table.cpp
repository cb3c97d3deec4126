#include <catch2/catch_test_macros.hpp>

#include "seriesfeat/core/nested_table.hpp"
#include "seriesfeat/core/series.hpp"
#include "common/panel_fixtures.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using seriesfeat::core::NestedTable;
using seriesfeat::core::Series;

TEST_CASE("NestedTable validates row widths and index", "[core][nested_table]") {
	using Row = NestedTable::Row;
	REQUIRE_THROWS_AS(NestedTable({"a", "b"}, {Row{std::vector<double>{1.0}}}), std::invalid_argument);
	REQUIRE_THROWS_AS(NestedTable({"a"}, {Row{std::vector<double>{1.0}}}, {0, 1}), std::invalid_argument);

	NestedTable table({"a"}, {Row{std::vector<double>{1.0, 2.0}}}, {42});
	REQUIRE(table.shape() == std::pair<std::size_t, std::size_t>(1, 1));
	REQUIRE(table.index().front() == 42);

	table.appendRow(Row{std::vector<double>{3.0, 4.0}}, 43);
	REQUIRE(table.rows() == 2);
	REQUIRE_THROWS_AS(table.appendRow(Row{}, 44), std::invalid_argument);
}

TEST_CASE("NestedTable defaults the index to positions", "[core][nested_table]") {
	const auto table = tests::fixtures::makeNestedTable(3, 2, 5);
	REQUIRE(table.index() == NestedTable::Index{0, 1, 2});
	REQUIRE(table.columnNames().size() == 2);
	REQUIRE(seriesfeat::core::holdsSeries(table.cell(2, 1)));
	REQUIRE_FALSE(seriesfeat::core::holdsSeries(tests::fixtures::makeFlatTable(1, 1).cell(0, 0)));
}

TEST_CASE("Series carries values, index and name", "[core][series]") {
	const Series labels({1.0, 0.0, 1.0}, "target");
	REQUIRE(labels.size() == 3);
	REQUIRE(labels.index() == Series::Index{0, 1, 2});
	REQUIRE(labels.name() == "target");
	REQUIRE(labels[2] == 1.0);

	const auto dense = labels.toDense();
	REQUIRE(dense.rank() == 1);
	REQUIRE(dense.values() == labels.values());

	REQUIRE_THROWS_AS(Series({1.0, 2.0}, "", {7}), std::invalid_argument);
}
