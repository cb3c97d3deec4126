#include "seriesfeat/validation.hpp"

#include "seriesfeat/errors.hpp"
#include "seriesfeat/utils/logging.hpp"

#include <string>
#include <utility>

namespace seriesfeat::validation {

namespace detail {

void requireMinInstances(std::size_t n_instances, int min_instances) {
	if (min_instances > 0 && n_instances < static_cast<std::size_t>(min_instances)) {
		throw InvalidShapeError("Found array with: " + std::to_string(n_instances) +
		                        " instance(s) but a minimum of: " + std::to_string(min_instances) + " is required.");
	}
}

} // namespace detail

namespace {

const char *containerName(const core::DataContainer &value) {
	if (std::holds_alternative<core::DenseArray>(value)) {
		return "DenseArray";
	}
	if (std::holds_alternative<core::NestedTable>(value)) {
		return "NestedTable";
	}
	return "Series";
}

void checkColumns(std::size_t n_columns, const CheckXOptions &options) {
	if (options.enforce_min_columns > 0 && n_columns < static_cast<std::size_t>(options.enforce_min_columns)) {
		throw InvalidShapeError("X must contain at least: " + std::to_string(options.enforce_min_columns) +
		                        " columns, but found only: " + std::to_string(n_columns) + ".");
	}
	if (options.enforce_univariate && n_columns > 1) {
		throw InvalidShapeError("This method requires X to be univariate with 1 variable, but found: " +
		                        std::to_string(n_columns) + " variables.");
	}
}

core::FeatureData checkDenseX(const core::DenseArray &X, const CheckXOptions &options) {
	// The rank must be confirmed before any extent is read.
	if (X.rank() != 3) {
		throw InvalidShapeError("If passed as a DenseArray, X must be a 3-dimensional array, but found shape: " +
		                        X.shapeString() + ".");
	}
	checkColumns(X.shape()[1], options);
	if (options.enforce_min_instances > 0) {
		enforceMinInstances(X, options.enforce_min_instances);
	}
	return X;
}

core::FeatureData checkTableX(const core::NestedTable &X, const CheckXOptions &options) {
	checkColumns(X.columns(), options);
	if (options.enforce_min_instances > 0) {
		enforceMinInstances(X, options.enforce_min_instances);
	}
	if (!core::isNestedTable(X)) {
		throw InvalidStructureError("If passed as a table, X must be a nested table with a series in every cell, "
		                            "but found scalar cells.");
	}
	if (options.return_numpy) {
		return core::nestedToDense(X);
	}
	return X;
}

} // namespace

core::FeatureData checkX(const core::DataContainer &X, const CheckXOptions &options) {
	SERIESFEAT_TRACE("checkX: {} with return_numpy={} enforce_univariate={} enforce_min_instances={} "
	                 "enforce_min_columns={}",
	                 containerName(X), options.return_numpy, options.enforce_univariate,
	                 options.enforce_min_instances, options.enforce_min_columns);

	if (const auto *array = std::get_if<core::DenseArray>(&X)) {
		return checkDenseX(*array, options);
	}
	if (const auto *table = std::get_if<core::NestedTable>(&X)) {
		return checkTableX(*table, options);
	}
	throw InvalidTypeError(std::string("X must be a NestedTable or a DenseArray, but found: ") + containerName(X) +
	                       ".");
}

core::FeatureData checkX(const core::DataContainer &X, bool return_numpy, bool enforce_univariate,
                         int enforce_min_instances, int enforce_min_columns) {
	CheckXOptions options;
	options.return_numpy = return_numpy;
	options.enforce_univariate = enforce_univariate;
	options.enforce_min_instances = enforce_min_instances;
	options.enforce_min_columns = enforce_min_columns;
	return checkX(X, options);
}

core::TargetData checkY(const core::DataContainer &y, const CheckYOptions &options) {
	if (std::holds_alternative<core::NestedTable>(y)) {
		throw InvalidTypeError(std::string("y must be either a Series or a DenseArray, but found type: ") +
		                       containerName(y) + ".");
	}

	if (options.enforce_min_instances > 0) {
		enforceMinInstances(y, options.enforce_min_instances);
	}

	if (const auto *series = std::get_if<core::Series>(&y)) {
		if (options.return_numpy) {
			SERIESFEAT_DEBUG("checkY: converting series of length {} to dense array", series->size());
			return series->toDense();
		}
		return *series;
	}
	return std::get<core::DenseArray>(y);
}

core::TargetData checkY(const core::DataContainer &y, int enforce_min_instances, bool return_numpy) {
	CheckYOptions options;
	options.enforce_min_instances = enforce_min_instances;
	options.return_numpy = return_numpy;
	return checkY(y, options);
}

ValidatedPair checkXY(const core::DataContainer &X, const core::DataContainer &y, const CheckXYOptions &options) {
	CheckXOptions x_options;
	x_options.enforce_univariate = options.enforce_univariate;
	x_options.enforce_min_instances = options.enforce_min_instances;
	x_options.enforce_min_columns = options.enforce_min_columns;

	ValidatedPair pair{checkX(X, x_options), checkY(y)};
	core::checkConsistentLength(pair.X, pair.y);
	return pair;
}

ValidatedPair checkXY(const core::DataContainer &X, const core::DataContainer &y, bool enforce_univariate,
                      int enforce_min_instances, int enforce_min_columns) {
	CheckXYOptions options;
	options.enforce_univariate = enforce_univariate;
	options.enforce_min_instances = enforce_min_instances;
	options.enforce_min_columns = enforce_min_columns;
	return checkXY(X, y, options);
}

} // namespace seriesfeat::validation
