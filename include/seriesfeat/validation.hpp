#pragma once

#include "seriesfeat/core/data_container.hpp"

#include <cstddef>
#include <iterator>
#include <type_traits>
#include <utility>

namespace seriesfeat::validation {

struct CheckXOptions {
	/// Convert a nested table to a dense 3-dimensional array before returning.
	bool return_numpy = false;
	/// Reject collections with more than one variable.
	bool enforce_univariate = false;
	/// Minimum number of instances; 0 disables the check.
	int enforce_min_instances = 1;
	/// Minimum number of variables (columns).
	int enforce_min_columns = 1;
};

struct CheckYOptions {
	int enforce_min_instances = 1;
	/// Convert a series to a dense 1-dimensional array before returning.
	bool return_numpy = false;
};

struct CheckXYOptions {
	bool enforce_univariate = false;
	int enforce_min_instances = 1;
	int enforce_min_columns = 1;
};

struct ValidatedPair {
	core::FeatureData X;
	core::TargetData y;
};

namespace detail {

template <typename T, typename = void>
struct HasInstanceAxis : std::false_type {};

template <typename T>
struct HasInstanceAxis<T, std::void_t<decltype(core::numInstances(std::declval<const T &>()))>> : std::true_type {};

template <typename T>
std::size_t leadingExtent(const T &value) {
	if constexpr (HasInstanceAxis<T>::value) {
		return core::numInstances(value);
	} else {
		// Plain ranges are read as 1-dimensional collections.
		return static_cast<std::size_t>(std::distance(std::begin(value), std::end(value)));
	}
}

void requireMinInstances(std::size_t n_instances, int min_instances);

} // namespace detail

/**
 * @brief Enforces a minimum number of instances along the leading axis.
 *
 * Accepts the seriesfeat containers, their variants and any other sized range.
 * A minimum of 0 or less disables the check.
 * @throws InvalidShapeError If fewer instances than required are found.
 */
template <typename T>
void enforceMinInstances(const T &value, int min_instances = 1) {
	if (min_instances > 0) {
		detail::requireMinInstances(detail::leadingExtent(value), min_instances);
	}
}

/**
 * @brief Validates a feature collection.
 *
 * Accepts a dense 3-dimensional array or a nested table, checks the variable
 * and instance counts and optionally converts a nested table to dense form.
 * The input is never modified.
 * @throws InvalidTypeError If X is neither a dense array nor a table.
 * @throws InvalidShapeError On a wrong rank, too few variables, a univariate
 *         violation or too few instances.
 * @throws InvalidStructureError If a table holds scalars instead of series.
 */
core::FeatureData checkX(const core::DataContainer &X, const CheckXOptions &options = {});

core::FeatureData checkX(const core::DataContainer &X, bool return_numpy, bool enforce_univariate = false,
                         int enforce_min_instances = 1, int enforce_min_columns = 1);

/**
 * @brief Validates a target collection.
 * @throws InvalidTypeError If y is neither a series nor a dense array.
 * @throws InvalidShapeError If y has too few instances.
 */
core::TargetData checkY(const core::DataContainer &y, const CheckYOptions &options = {});

core::TargetData checkY(const core::DataContainer &y, int enforce_min_instances, bool return_numpy = false);

/**
 * @brief Validates a feature/target pair for joint use.
 *
 * The options only apply to X. y is checked with the checkY defaults, which is
 * enough for the instance minimum because both lengths must agree.
 * @throws InconsistentLengthError If X and y differ in their number of instances.
 */
ValidatedPair checkXY(const core::DataContainer &X, const core::DataContainer &y, const CheckXYOptions &options = {});

ValidatedPair checkXY(const core::DataContainer &X, const core::DataContainer &y, bool enforce_univariate,
                      int enforce_min_instances = 1, int enforce_min_columns = 1);

} // namespace seriesfeat::validation
