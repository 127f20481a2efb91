#pragma once

#include <string>
#include "errors.hpp"

namespace stockledger {
namespace validation {

/**
 * Require that a value is positive (greater than zero).
 */
template<typename T>
void require_positive(T value, const std::string& field_name = "value") {
    if (value <= 0) {
        throw InvalidArgumentError(field_name + " must be positive");
    }
}

/**
 * Require that a value is non-negative (zero or greater).
 */
template<typename T>
void require_non_negative(T value, const std::string& field_name = "value") {
    if (value < 0) {
        throw InvalidArgumentError(field_name + " must be non-negative");
    }
}

template<typename T>
void require_non_zero(T value, const std::string& field_name = "value") {
    if (value == 0) {
        throw InvalidArgumentError(field_name + " must be non-zero");
    }
}

/**
 * Require that a string is not empty.
 */
inline void require_not_empty(const std::string& value, const std::string& field_name = "value") {
    if (value.empty()) {
        throw InvalidArgumentError(field_name + " must not be empty");
    }
}

} // namespace validation
} // namespace stockledger
