#pragma once

#include "seriesfeat/core/dense_array.hpp"
#include "seriesfeat/core/nested_table.hpp"
#include "seriesfeat/core/series.hpp"

#include <cstddef>
#include <variant>
#include <vector>

namespace seriesfeat::core {

/// Any container a caller may hand to a validator.
using DataContainer = std::variant<DenseArray, NestedTable, Series>;

/// Representations accepted for a feature collection.
using FeatureData = std::variant<DenseArray, NestedTable>;

/// Representations accepted for a target collection.
using TargetData = std::variant<DenseArray, Series>;

/**
 * @brief Returns true if every cell of the table embeds a series.
 *
 * A table without rows or without columns has no scalar cell and is therefore
 * considered nested.
 */
bool isNestedTable(const NestedTable &table) noexcept;

/**
 * @brief Converts a nested table into a dense (instance, variable, timepoint) array.
 *
 * The timepoint extent is taken from the first cell and every other cell must
 * have the same length; nothing is padded or truncated.
 * @throws InvalidStructureError If a cell holds a scalar or the cell lengths differ.
 */
DenseArray nestedToDense(const NestedTable &table);

/**
 * @brief Converts a dense (instance, variable, timepoint) array into a nested table.
 *
 * Columns are named var_0..var_{c-1} and rows are labelled 0..n-1.
 * @throws InvalidShapeError If the array is not 3-dimensional.
 */
NestedTable denseToNested(const DenseArray &array);

/**
 * @brief Length of the leading (instance) axis.
 * @throws InvalidShapeError If the array is 0-dimensional.
 */
std::size_t numInstances(const DenseArray &array);

std::size_t numInstances(const NestedTable &table) noexcept;

std::size_t numInstances(const Series &series) noexcept;

template <typename... Alternatives>
std::size_t numInstances(const std::variant<Alternatives...> &value) {
	return std::visit([](const auto &alternative) { return numInstances(alternative); }, value);
}

/**
 * @brief Checks that all measured instance counts agree.
 * @throws InconsistentLengthError Listing every count if they differ.
 */
void checkConsistentLengths(const std::vector<std::size_t> &lengths);

/**
 * @brief Checks that all containers share the same number of instances.
 * @throws InconsistentLengthError If the leading-axis lengths differ.
 */
template <typename... Containers>
void checkConsistentLength(const Containers &...containers) {
	checkConsistentLengths({numInstances(containers)...});
}

} // namespace seriesfeat::core
