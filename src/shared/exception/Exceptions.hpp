/**
 * @file Exceptions.hpp
 * @brief Layered exception hierarchy (domain, application, infrastructure)
 */

#pragma once

#include <json/json.h>
#include <stdexcept>
#include <string>

namespace shared::exception {

/**
 * @brief Common base carrying a machine-readable code next to the message
 */
class BaseException : public std::runtime_error {
private:
    std::string code_;
    std::string message_;

public:
    /**
     * @param code Error code (e.g., "VALIDATION_ERROR")
     * @param message Human-readable error message
     */
    BaseException(std::string code, std::string message)
        : std::runtime_error(message),
          code_(std::move(code)),
          message_(std::move(message)) {}

    [[nodiscard]] const std::string& getCode() const noexcept {
        return code_;
    }

    [[nodiscard]] const std::string& getMessage() const noexcept {
        return message_;
    }

    /**
     * @brief Error body used by HTTP handlers
     */
    [[nodiscard]] Json::Value toJson() const {
        Json::Value json;
        json["success"] = false;
        json["error"] = code_;
        json["message"] = message_;
        return json;
    }
};

/**
 * @brief Business rules violated or domain invariants broken
 */
class DomainException : public BaseException {
public:
    using BaseException::BaseException;
};

/**
 * @brief Use case execution errors
 */
class ApplicationException : public BaseException {
public:
    using BaseException::BaseException;
};

/**
 * @brief Failures of external systems (database, hardware, drivers)
 */
class InfrastructureException : public BaseException {
public:
    using BaseException::BaseException;
};

} // namespace shared::exception
