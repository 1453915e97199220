/**
 * @file TagIdentifier.hpp
 * @brief Value Object for a normalized NFC tag UID
 */

#pragma once

#include "shared/domain/ValueObject.hpp"
#include "nfcassociation/domain/exception/NfcExceptions.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace nfcassociation::domain::model {

/**
 * @brief Tag UID as a lowercase hex string of at least 4 characters
 *
 * Readers report UIDs in several spellings ("04:F7:ED:A4", "04-f7-ed-a4",
 * "04F7EDA4"); all of them normalize to the same identifier.
 */
class TagIdentifier : public shared::domain::StringValueObject {
public:
    static constexpr size_t MIN_LENGTH = 4;

private:
    explicit TagIdentifier(std::string value) : StringValueObject(std::move(value)) {
        validate();
    }

    void validate() const override {
        if (value_.empty()) {
            throw exception::ValidationError("Tag UID must not be empty");
        }
        if (value_.length() < MIN_LENGTH) {
            throw exception::ValidationError(
                "Tag UID must be at least " + std::to_string(MIN_LENGTH) +
                " hex characters: " + value_);
        }
        auto bad = std::find_if(value_.begin(), value_.end(), [](unsigned char c) {
            return !std::isxdigit(c);
        });
        if (bad != value_.end()) {
            throw exception::ValidationError("Tag UID must be hexadecimal: " + value_);
        }
    }

    static std::string normalize(const std::string& raw) {
        std::string result;
        result.reserve(raw.size());
        for (unsigned char c : raw) {
            if (c == ':' || c == '-' || std::isspace(c)) {
                continue;
            }
            result.push_back(static_cast<char>(std::tolower(c)));
        }
        return result;
    }

public:
    /**
     * @brief Parse and normalize a UID as reported by a reader or a client
     * @throws exception::ValidationError if the normalized UID is invalid
     */
    static TagIdentifier of(const std::string& raw) {
        return TagIdentifier(normalize(raw));
    }

    /**
     * @brief Build from the raw UID bytes of an ISO 14443 frame
     */
    static TagIdentifier fromRawBytes(const std::vector<uint8_t>& bytes) {
        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        for (auto b : bytes) {
            ss << std::setw(2) << static_cast<int>(b);
        }
        return of(ss.str());
    }

    [[nodiscard]] const std::string& getUid() const noexcept {
        return value_;
    }
};

} // namespace nfcassociation::domain::model

namespace std {
template<>
struct hash<nfcassociation::domain::model::TagIdentifier> {
    size_t operator()(const nfcassociation::domain::model::TagIdentifier& id) const {
        return hash<std::string>{}(id.getValue());
    }
};
} // namespace std
