/**
 * @file ValueObject.hpp
 * @brief Base class for Value Objects in DDD
 */

#pragma once

#include <string>
#include <functional>
#include <utility>

namespace shared::domain {

/**
 * @brief Base template class for Value Objects
 *
 * Value Objects are defined by their attributes. Two Value Objects with the
 * same attributes are considered equal. Derived classes expose no mutators,
 * so assignment only ever replaces a whole value.
 *
 * @tparam T The type of the underlying value
 */
template<typename T>
class ValueObject {
protected:
    T value_;

    explicit ValueObject(T value) : value_(std::move(value)) {}

    /**
     * @brief Validate the value
     * Override in derived classes to add validation logic
     */
    virtual void validate() const {}

public:
    virtual ~ValueObject() = default;

    ValueObject(const ValueObject&) = default;
    ValueObject& operator=(const ValueObject&) = default;
    ValueObject(ValueObject&&) noexcept = default;
    ValueObject& operator=(ValueObject&&) noexcept = default;

    [[nodiscard]] const T& getValue() const noexcept {
        return value_;
    }

    bool operator==(const ValueObject& other) const {
        return value_ == other.value_;
    }

    bool operator!=(const ValueObject& other) const {
        return !(*this == other);
    }

    /**
     * @brief Less than comparison (for use in ordered containers)
     */
    bool operator<(const ValueObject& other) const {
        return value_ < other.value_;
    }
};

/**
 * @brief Specialization for string-based Value Objects
 */
class StringValueObject : public ValueObject<std::string> {
protected:
    explicit StringValueObject(std::string value)
        : ValueObject<std::string>(std::move(value)) {}

public:
    [[nodiscard]] bool isEmpty() const noexcept {
        return value_.empty();
    }

    [[nodiscard]] size_t length() const noexcept {
        return value_.length();
    }

    [[nodiscard]] const std::string& toString() const noexcept {
        return value_;
    }
};

} // namespace shared::domain
