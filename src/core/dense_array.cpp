#include "seriesfeat/core/dense_array.hpp"

#include <algorithm>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace seriesfeat::core {

namespace {

std::size_t elementCount(const DenseArray::Shape &shape) {
	if (std::find(shape.begin(), shape.end(), std::size_t{0}) != shape.end()) {
		return 0;
	}
	std::size_t count = 1;
	for (auto extent : shape) {
		if (count > std::numeric_limits<std::size_t>::max() / extent) {
			throw std::invalid_argument("Array of shape " + formatShape(shape) + " has too many elements to address.");
		}
		count *= extent;
	}
	return count;
}

} // namespace

DenseArray::DenseArray() : shape_{0} {}

DenseArray::DenseArray(Shape shape, Values values) : shape_(std::move(shape)), values_(std::move(values)) {
	const auto expected = elementCount(shape_);
	if (values_.size() != expected) {
		throw std::invalid_argument("Array of shape " + formatShape(shape_) + " requires " + std::to_string(expected) +
		                            " values, but " + std::to_string(values_.size()) + " were given.");
	}
}

DenseArray DenseArray::zeros(Shape shape) {
	const auto count = elementCount(shape);
	return DenseArray(std::move(shape), Values(count, 0.0));
}

DenseArray DenseArray::fromVector(Values values) {
	Shape shape{values.size()};
	return DenseArray(std::move(shape), std::move(values));
}

double DenseArray::at(std::size_t index) const {
	if (rank() != 1) {
		throw std::logic_error("Single-index access requires a 1-dimensional array, but found shape " + shapeString() +
		                       ".");
	}
	return values_.at(index);
}

double DenseArray::at(std::size_t instance, std::size_t variable, std::size_t timepoint) const {
	return values_[offset3(instance, variable, timepoint)];
}

double &DenseArray::at(std::size_t instance, std::size_t variable, std::size_t timepoint) {
	return values_[offset3(instance, variable, timepoint)];
}

DenseArray::InstanceView DenseArray::instance(std::size_t index) const {
	if (rank() != 3) {
		throw std::logic_error("Instance views require a 3-dimensional array, but found shape " + shapeString() + ".");
	}
	if (index >= shape_[0]) {
		throw std::out_of_range("Requested instance exceeds the number of instances.");
	}
	const auto variables = shape_[1];
	const auto timepoints = shape_[2];
	return InstanceView(values_.data() + index * variables * timepoints, static_cast<Eigen::Index>(variables),
	                    static_cast<Eigen::Index>(timepoints));
}

std::string DenseArray::shapeString() const {
	return formatShape(shape_);
}

std::size_t DenseArray::offset3(std::size_t instance, std::size_t variable, std::size_t timepoint) const {
	if (rank() != 3) {
		throw std::logic_error("Three-index access requires a 3-dimensional array, but found shape " + shapeString() +
		                       ".");
	}
	if (instance >= shape_[0] || variable >= shape_[1] || timepoint >= shape_[2]) {
		throw std::out_of_range("Index exceeds the array extents " + shapeString() + ".");
	}
	return (instance * shape_[1] + variable) * shape_[2] + timepoint;
}

std::string formatShape(const DenseArray::Shape &shape) {
	std::ostringstream oss;
	oss << '(';
	for (std::size_t i = 0; i < shape.size(); ++i) {
		if (i > 0) {
			oss << ", ";
		}
		oss << shape[i];
	}
	oss << ')';
	return oss.str();
}

} // namespace seriesfeat::core
