#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace seriesfeat::core {

/**
 * @class NestedTable
 * @brief Instance-indexed table whose cells may embed a whole time series.
 *
 * Each row is one instance and each column one variable. A well-formed panel
 * stores a series in every cell; cells holding a plain scalar are representable
 * so that validators can reject ordinary flat tables with a precise error.
 */
class NestedTable {
public:
	using Cell = std::variant<double, std::vector<double>>;
	using Row = std::vector<Cell>;
	using Index = std::vector<std::int64_t>;

	NestedTable() = default;

	/**
	 * @brief Constructs a table from column names and rows.
	 * @param columns Column (variable) names.
	 * @param rows One row per instance, each with one cell per column.
	 * @param index Optional row labels; defaults to 0..n-1.
	 * @throws std::invalid_argument If a row width or the index length is inconsistent.
	 */
	NestedTable(std::vector<std::string> columns, std::vector<Row> rows, Index index = {});

	/**
	 * @brief Number of rows (instances).
	 */
	std::size_t rows() const noexcept {
		return rows_.size();
	}

	/**
	 * @brief Number of columns (variables).
	 */
	std::size_t columns() const noexcept {
		return columns_.size();
	}

	/**
	 * @brief Returns the table dimensions as (rows, columns).
	 */
	std::pair<std::size_t, std::size_t> shape() const noexcept {
		return {rows(), columns()};
	}

	bool empty() const noexcept {
		return rows_.empty() || columns_.empty();
	}

	const std::vector<std::string> &columnNames() const noexcept {
		return columns_;
	}

	const Index &index() const noexcept {
		return index_;
	}

	const Row &row(std::size_t position) const {
		return rows_.at(position);
	}

	const Cell &cell(std::size_t row, std::size_t column) const {
		return rows_.at(row).at(column);
	}

	/**
	 * @brief Appends one instance.
	 * @throws std::invalid_argument If the row width does not match the column count.
	 */
	void appendRow(Row row, std::int64_t label);

	bool operator==(const NestedTable &other) const {
		return columns_ == other.columns_ && index_ == other.index_ && rows_ == other.rows_;
	}

	bool operator!=(const NestedTable &other) const {
		return !(*this == other);
	}

private:
	std::vector<std::string> columns_;
	std::vector<Row> rows_;
	Index index_;
};

/**
 * @brief Returns true if the cell embeds a series rather than a scalar.
 */
inline bool holdsSeries(const NestedTable::Cell &cell) noexcept {
	return std::holds_alternative<std::vector<double>>(cell);
}

} // namespace seriesfeat::core
