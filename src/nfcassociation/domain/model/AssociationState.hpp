/**
 * @file AssociationState.hpp
 * @brief Enum for association session state
 */

#pragma once

#include <string>
#include <stdexcept>

namespace nfcassociation::domain::model {

/**
 * @brief Association session state
 */
enum class AssociationState {
    LISTENING,    // Waiting for a tag
    SUCCESS,      // Tag bound to the session's playlist
    DUPLICATE,    // Tag already bound elsewhere, no override
    STOPPED,      // Stopped by the user
    TIMEOUT,      // Expired without a tag
    ERROR,        // Processing or sync failure
    CANCELLED     // Accepted from older clients, equivalent to STOPPED
};

inline std::string toString(AssociationState state) {
    switch (state) {
        case AssociationState::LISTENING: return "LISTENING";
        case AssociationState::SUCCESS: return "SUCCESS";
        case AssociationState::DUPLICATE: return "DUPLICATE";
        case AssociationState::STOPPED: return "STOPPED";
        case AssociationState::TIMEOUT: return "TIMEOUT";
        case AssociationState::ERROR: return "ERROR";
        case AssociationState::CANCELLED: return "CANCELLED";
        default: throw std::invalid_argument("Unknown AssociationState");
    }
}

inline AssociationState parseAssociationState(const std::string& str) {
    if (str == "LISTENING") return AssociationState::LISTENING;
    if (str == "SUCCESS") return AssociationState::SUCCESS;
    if (str == "DUPLICATE") return AssociationState::DUPLICATE;
    if (str == "STOPPED") return AssociationState::STOPPED;
    if (str == "TIMEOUT") return AssociationState::TIMEOUT;
    if (str == "ERROR") return AssociationState::ERROR;
    if (str == "CANCELLED") return AssociationState::CANCELLED;
    throw std::invalid_argument("Unknown association state: " + str);
}

/**
 * @brief Every state other than LISTENING is terminal
 */
inline bool isTerminal(AssociationState state) {
    return state != AssociationState::LISTENING;
}

/**
 * @brief Check if state transition is valid
 */
inline bool isValidTransition(AssociationState from, AssociationState to) {
    return from == AssociationState::LISTENING && to != AssociationState::LISTENING;
}

} // namespace nfcassociation::domain::model
