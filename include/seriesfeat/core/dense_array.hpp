#pragma once

#include <Eigen/Dense>

#include <cstddef>
#include <string>
#include <vector>

namespace seriesfeat::core {

/**
 * @class DenseArray
 * @brief Owning n-dimensional numeric array stored in row-major order.
 *
 * Feature panels use rank 3 with axes (instance, variable, timepoint); targets
 * normally use rank 1. The rank is a runtime property so that validators can
 * report arrays of the wrong rank instead of rejecting them at compile time.
 */
class DenseArray {
public:
	using Shape = std::vector<std::size_t>;
	using Values = std::vector<double>;
	using InstanceMatrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
	using InstanceView = Eigen::Map<const InstanceMatrix>;

	/**
	 * @brief Constructs an empty rank-1 array.
	 */
	DenseArray();

	/**
	 * @brief Constructs an array from its extents and row-major values.
	 * @throws std::invalid_argument if the value count does not match the shape.
	 */
	DenseArray(Shape shape, Values values);

	/**
	 * @brief Creates a zero-filled array of the given shape.
	 */
	static DenseArray zeros(Shape shape);

	/**
	 * @brief Creates a rank-1 array holding the given values.
	 */
	static DenseArray fromVector(Values values);

	const Shape &shape() const noexcept {
		return shape_;
	}

	std::size_t rank() const noexcept {
		return shape_.size();
	}

	/**
	 * @brief Total number of stored elements.
	 */
	std::size_t size() const noexcept {
		return values_.size();
	}

	bool empty() const noexcept {
		return values_.empty();
	}

	const Values &values() const noexcept {
		return values_;
	}

	/**
	 * @brief Element access for rank-1 arrays.
	 * @throws std::logic_error if the array is not rank 1.
	 * @throws std::out_of_range if the index exceeds the extent.
	 */
	double at(std::size_t index) const;

	/**
	 * @brief Element access for rank-3 arrays.
	 * @throws std::logic_error if the array is not rank 3.
	 * @throws std::out_of_range if any index exceeds its extent.
	 */
	double at(std::size_t instance, std::size_t variable, std::size_t timepoint) const;
	double &at(std::size_t instance, std::size_t variable, std::size_t timepoint);

	/**
	 * @brief Read-only (variables x timepoints) view of one instance of a rank-3 array.
	 *
	 * The view aliases this array's storage and is invalidated when it is destroyed.
	 */
	InstanceView instance(std::size_t index) const;

	/**
	 * @brief Formats the extents as "(d0, d1, ...)".
	 */
	std::string shapeString() const;

	bool operator==(const DenseArray &other) const noexcept {
		return shape_ == other.shape_ && values_ == other.values_;
	}

	bool operator!=(const DenseArray &other) const noexcept {
		return !(*this == other);
	}

private:
	std::size_t offset3(std::size_t instance, std::size_t variable, std::size_t timepoint) const;

	Shape shape_;
	Values values_;
};

/**
 * @brief Formats a list of extents as "(d0, d1, ...)".
 */
std::string formatShape(const DenseArray::Shape &shape);

} // namespace seriesfeat::core
