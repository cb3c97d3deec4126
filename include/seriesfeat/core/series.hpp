#pragma once

#include "seriesfeat/core/dense_array.hpp"

#include <cstddef>
#include <cstdint>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace seriesfeat::core {

/**
 * @class Series
 * @brief Flat indexed sequence of values, one entry per instance.
 *
 * This is the tabular single-column form of a target collection. The index
 * labels default to the positions 0..n-1 and are carried along untouched; the
 * validators only look at the positional order.
 */
class Series {
public:
	using Index = std::vector<std::int64_t>;

	Series() = default;

	/**
	 * @brief Constructs a series from its values.
	 * @param values The entries, one per instance.
	 * @param name Optional series name.
	 * @param index Optional index labels; defaults to 0..n-1.
	 * @throws std::invalid_argument If the index and values differ in length.
	 */
	explicit Series(std::vector<double> values, std::string name = {}, Index index = {})
	    : values_(std::move(values)), index_(std::move(index)), name_(std::move(name)) {
		if (index_.empty()) {
			index_.resize(values_.size());
			std::iota(index_.begin(), index_.end(), std::int64_t{0});
		} else if (index_.size() != values_.size()) {
			throw std::invalid_argument("Series index and values must have the same size.");
		}
	}

	std::size_t size() const noexcept {
		return values_.size();
	}

	bool empty() const noexcept {
		return values_.empty();
	}

	const std::vector<double> &values() const noexcept {
		return values_;
	}

	const Index &index() const noexcept {
		return index_;
	}

	const std::string &name() const noexcept {
		return name_;
	}

	double operator[](std::size_t position) const {
		return values_[position];
	}

	double at(std::size_t position) const {
		return values_.at(position);
	}

	/**
	 * @brief Copies the values into a rank-1 dense array, dropping index and name.
	 */
	DenseArray toDense() const {
		return DenseArray::fromVector(values_);
	}

	bool operator==(const Series &other) const noexcept {
		return values_ == other.values_ && index_ == other.index_ && name_ == other.name_;
	}

	bool operator!=(const Series &other) const noexcept {
		return !(*this == other);
	}

private:
	std::vector<double> values_;
	Index index_;
	std::string name_;
};

} // namespace seriesfeat::core
