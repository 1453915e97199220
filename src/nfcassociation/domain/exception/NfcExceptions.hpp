/**
 * @file NfcExceptions.hpp
 * @brief Error taxonomy of the NFC association context
 */

#pragma once

#include "shared/exception/Exceptions.hpp"

namespace nfcassociation::domain::exception {

/**
 * @brief Malformed input (blank playlist id, bad tag uid, non-positive timeout)
 */
class ValidationError : public shared::exception::DomainException {
public:
    explicit ValidationError(std::string message)
        : DomainException("VALIDATION_ERROR", std::move(message)) {}
};

/**
 * @brief An active association session already exists for the playlist
 */
class ConflictError : public shared::exception::DomainException {
public:
    explicit ConflictError(std::string message)
        : DomainException("SESSION_CONFLICT", std::move(message)) {}
};

/**
 * @brief Unknown session or tag
 */
class NotFoundError : public shared::exception::ApplicationException {
public:
    explicit NotFoundError(std::string message)
        : ApplicationException("NOT_FOUND", std::move(message)) {}
};

/**
 * @brief NFC reader start/stop failure
 */
class HardwareError : public shared::exception::InfrastructureException {
public:
    explicit HardwareError(std::string message)
        : InfrastructureException("HARDWARE_ERROR", std::move(message)) {}
};

/**
 * @brief Playlist-side association write failed
 */
class SyncError : public shared::exception::InfrastructureException {
public:
    explicit SyncError(std::string message)
        : InfrastructureException("SYNC_ERROR", std::move(message)) {}
};

} // namespace nfcassociation::domain::exception
