#include "seriesfeat/core/nested_table.hpp"

#include <numeric>
#include <stdexcept>

namespace seriesfeat::core {

NestedTable::NestedTable(std::vector<std::string> columns, std::vector<Row> rows, Index index)
    : columns_(std::move(columns)), rows_(std::move(rows)), index_(std::move(index)) {
	for (std::size_t r = 0; r < rows_.size(); ++r) {
		if (rows_[r].size() != columns_.size()) {
			throw std::invalid_argument("Row " + std::to_string(r) + " has " + std::to_string(rows_[r].size()) +
			                            " cells but the table has " + std::to_string(columns_.size()) + " columns.");
		}
	}
	if (index_.empty()) {
		index_.resize(rows_.size());
		std::iota(index_.begin(), index_.end(), std::int64_t{0});
	} else if (index_.size() != rows_.size()) {
		throw std::invalid_argument("Table index and rows must have the same size.");
	}
}

void NestedTable::appendRow(Row row, std::int64_t label) {
	if (row.size() != columns_.size()) {
		throw std::invalid_argument("Row has " + std::to_string(row.size()) + " cells but the table has " +
		                            std::to_string(columns_.size()) + " columns.");
	}
	rows_.push_back(std::move(row));
	index_.push_back(label);
}

} // namespace seriesfeat::core
