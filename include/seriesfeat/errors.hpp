#pragma once

#include <stdexcept>
#include <string>

namespace seriesfeat {

/**
 * @class ValidationError
 * @brief Base class for every input validation failure raised by seriesfeat.
 *
 * Derives from std::invalid_argument so callers that only care about bad input
 * can catch the standard type.
 */
class ValidationError : public std::invalid_argument {
public:
	explicit ValidationError(const std::string &message) : std::invalid_argument(message) {}
};

/// Input is not one of the permitted representations for its role.
class InvalidTypeError : public ValidationError {
public:
	explicit InvalidTypeError(const std::string &message) : ValidationError(message) {}
};

/// Rank mismatch, too few variables, univariate violation or too few instances.
class InvalidShapeError : public ValidationError {
public:
	explicit InvalidShapeError(const std::string &message) : ValidationError(message) {}
};

/// A table whose cells are not embedded series, or a non-uniform nested table.
class InvalidStructureError : public ValidationError {
public:
	explicit InvalidStructureError(const std::string &message) : ValidationError(message) {}
};

/// Paired collections disagree on the number of instances.
class InconsistentLengthError : public ValidationError {
public:
	explicit InconsistentLengthError(const std::string &message) : ValidationError(message) {}
};

} // namespace seriesfeat
