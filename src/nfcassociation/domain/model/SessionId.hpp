/**
 * @file SessionId.hpp
 * @brief Value Object for Association Session ID (UUID)
 */

#pragma once

#include "shared/domain/ValueObject.hpp"
#include "nfcassociation/domain/exception/NfcExceptions.hpp"
#include <string>
#include <regex>
#include <random>
#include <mutex>
#include <sstream>
#include <iomanip>

namespace nfcassociation::domain::model {

/**
 * @brief Association Session ID Value Object (UUID v4)
 */
class SessionId : public shared::domain::StringValueObject {
private:
    explicit SessionId(std::string value) : StringValueObject(std::move(value)) {
        validate();
    }

    void validate() const override {
        static const std::regex uuidRegex(
            "^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$",
            std::regex::icase
        );

        if (!std::regex_match(value_, uuidRegex)) {
            throw exception::ValidationError("Session ID must be a valid UUID v4: " + value_);
        }
    }

public:
    /**
     * @brief Create from an existing UUID string (e.g. a path parameter)
     */
    static SessionId of(const std::string& value) {
        return SessionId(value);
    }

    /**
     * @brief Generate a new UUID v4
     */
    static SessionId generate() {
        static std::mutex genMutex;
        static std::random_device rd;
        static std::mt19937_64 gen(rd());
        static std::uniform_int_distribution<uint64_t> dis;

        uint64_t ab;
        uint64_t cd;
        {
            std::lock_guard<std::mutex> lock(genMutex);
            ab = dis(gen);
            cd = dis(gen);
        }

        // Set version (4) and variant (RFC 4122)
        ab = (ab & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
        cd = (cd & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        ss << std::setw(8) << (ab >> 32) << '-';
        ss << std::setw(4) << ((ab >> 16) & 0xFFFF) << '-';
        ss << std::setw(4) << (ab & 0xFFFF) << '-';
        ss << std::setw(4) << (cd >> 48) << '-';
        ss << std::setw(12) << (cd & 0x0000FFFFFFFFFFFFULL);

        return SessionId(ss.str());
    }
};

} // namespace nfcassociation::domain::model

namespace std {
template<>
struct hash<nfcassociation::domain::model::SessionId> {
    size_t operator()(const nfcassociation::domain::model::SessionId& id) const {
        return hash<std::string>{}(id.getValue());
    }
};
} // namespace std
