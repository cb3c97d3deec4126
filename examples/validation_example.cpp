#include "seriesfeat/core/data_container.hpp"
#include "seriesfeat/errors.hpp"
#include "seriesfeat/utils/logging.hpp"
#include "seriesfeat/validation.hpp"
#include <functional>
#include <iostream>
#include <string>
#include <vector>

using namespace seriesfeat;

namespace {

// Two channels of a short gesture recording per instance.
core::NestedTable gesturePanel(std::size_t instances, std::size_t length) {
	std::vector<core::NestedTable::Row> rows;
	for (std::size_t i = 0; i < instances; ++i) {
		std::vector<double> x(length);
		std::vector<double> y(length);
		for (std::size_t t = 0; t < length; ++t) {
			x[t] = static_cast<double>(i) + 0.1 * static_cast<double>(t);
			y[t] = static_cast<double>(i) - 0.1 * static_cast<double>(t);
		}
		rows.push_back({std::move(x), std::move(y)});
	}
	return core::NestedTable({"accel_x", "accel_y"}, std::move(rows));
}

void printHeader(const std::string &title) {
	std::cout << "\n=== " << title << " ===\n\n";
}

void tryCheck(const std::string &label, const std::function<void()> &check) {
	try {
		check();
		std::cout << "  " << label << ": ok\n";
	} catch (const ValidationError &e) {
		std::cout << "  " << label << ": " << e.what() << "\n";
	}
}

} // namespace

int main() {
	utils::Logging::init(spdlog::level::debug);

	const auto X = gesturePanel(6, 8);
	const core::Series y({0.0, 1.0, 0.0, 1.0, 1.0, 0.0}, "gesture");

	printHeader("Nested table to dense array");
	const auto dense = std::get<core::DenseArray>(validation::checkX(X, true));
	std::cout << "  shape: " << dense.shapeString() << "\n";
	std::cout << "  instance 2:\n" << dense.instance(2) << "\n";

	printHeader("Pair validation");
	tryCheck("checkXY(X, y)", [&] { validation::checkXY(X, y); });
	tryCheck("checkXY(X, y[:4])", [&] {
		validation::checkXY(X, core::Series({0.0, 1.0, 0.0, 1.0}));
	});
	tryCheck("checkXY(X, y, univariate)", [&] { validation::checkXY(X, y, true); });

	printHeader("Feature validation failures");
	tryCheck("checkX(y)", [&] { validation::checkX(y); });
	tryCheck("checkX(rank-2 array)", [&] { validation::checkX(core::DenseArray::zeros({6, 8})); });

	return 0;
}
