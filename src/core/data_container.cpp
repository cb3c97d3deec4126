#include "seriesfeat/core/data_container.hpp"

#include "seriesfeat/errors.hpp"
#include "seriesfeat/utils/logging.hpp"

#include <algorithm>
#include <cstddef>
#include <sstream>
#include <string>
#include <utility>

namespace seriesfeat::core {

bool isNestedTable(const NestedTable &table) noexcept {
	for (std::size_t r = 0; r < table.rows(); ++r) {
		const auto &row = table.row(r);
		if (!std::all_of(row.begin(), row.end(), holdsSeries)) {
			return false;
		}
	}
	return true;
}

DenseArray nestedToDense(const NestedTable &table) {
	const auto [n_instances, n_columns] = table.shape();

	std::size_t n_timepoints = 0;
	if (n_instances > 0 && n_columns > 0) {
		const auto &first = table.cell(0, 0);
		if (!holdsSeries(first)) {
			throw InvalidStructureError("Cannot convert a table with scalar cells to a 3-dimensional array: "
			                            "cell (0, 0) does not hold a series.");
		}
		n_timepoints = std::get<std::vector<double>>(first).size();
	}

	SERIESFEAT_DEBUG("Converting nested table with {} instance(s) and {} column(s) to dense array, {} timepoint(s)",
	                 n_instances, n_columns, n_timepoints);

	DenseArray::Values values;
	values.reserve(n_instances * n_columns * n_timepoints);
	for (std::size_t r = 0; r < n_instances; ++r) {
		for (std::size_t c = 0; c < n_columns; ++c) {
			const auto &cell = table.cell(r, c);
			if (!holdsSeries(cell)) {
				throw InvalidStructureError("Cannot convert a table with scalar cells to a 3-dimensional array: cell (" +
				                            std::to_string(r) + ", " + std::to_string(c) +
				                            ") does not hold a series.");
			}
			const auto &series = std::get<std::vector<double>>(cell);
			if (series.size() != n_timepoints) {
				throw InvalidStructureError("All series in a nested table must have the same length to be converted, "
				                            "but cell (" +
				                            std::to_string(r) + ", " + std::to_string(c) + ") has " +
				                            std::to_string(series.size()) + " timepoint(s) instead of " +
				                            std::to_string(n_timepoints) + ".");
			}
			values.insert(values.end(), series.begin(), series.end());
		}
	}

	return DenseArray({n_instances, n_columns, n_timepoints}, std::move(values));
}

NestedTable denseToNested(const DenseArray &array) {
	if (array.rank() != 3) {
		throw InvalidShapeError("Only 3-dimensional arrays can be converted to a nested table, but found shape: " +
		                        array.shapeString() + ".");
	}
	const auto &shape = array.shape();
	const auto n_instances = shape[0];
	const auto n_columns = shape[1];
	const auto n_timepoints = shape[2];

	std::vector<std::string> columns;
	columns.reserve(n_columns);
	for (std::size_t c = 0; c < n_columns; ++c) {
		columns.push_back("var_" + std::to_string(c));
	}

	std::vector<NestedTable::Row> rows;
	rows.reserve(n_instances);
	auto cursor = array.values().begin();
	for (std::size_t r = 0; r < n_instances; ++r) {
		NestedTable::Row row;
		row.reserve(n_columns);
		for (std::size_t c = 0; c < n_columns; ++c) {
			const auto end = cursor + static_cast<std::ptrdiff_t>(n_timepoints);
			row.emplace_back(std::vector<double>(cursor, end));
			cursor = end;
		}
		rows.push_back(std::move(row));
	}

	SERIESFEAT_DEBUG("Converted dense array of shape {} to nested table", array.shapeString());
	return NestedTable(std::move(columns), std::move(rows));
}

std::size_t numInstances(const DenseArray &array) {
	if (array.rank() == 0) {
		throw InvalidShapeError("A 0-dimensional array has no instance axis.");
	}
	return array.shape().front();
}

std::size_t numInstances(const NestedTable &table) noexcept {
	return table.rows();
}

std::size_t numInstances(const Series &series) noexcept {
	return series.size();
}

void checkConsistentLengths(const std::vector<std::size_t> &lengths) {
	if (lengths.empty()) {
		return;
	}
	const bool consistent =
	    std::all_of(lengths.begin(), lengths.end(), [&](std::size_t length) { return length == lengths.front(); });
	if (consistent) {
		return;
	}

	std::ostringstream oss;
	oss << "Found input variables with inconsistent numbers of instances: [";
	for (std::size_t i = 0; i < lengths.size(); ++i) {
		if (i > 0) {
			oss << ", ";
		}
		oss << lengths[i];
	}
	oss << "]";
	throw InconsistentLengthError(oss.str());
}

} // namespace seriesfeat::core
