/**
 * @file AggregateRoot.hpp
 * @brief Base class for Aggregate Roots in DDD
 */

#pragma once

#include "shared/domain/Entity.hpp"

namespace shared::domain {

/**
 * @brief Base template class for Aggregate Roots
 *
 * All external access to the aggregate goes through the root. The version
 * counter is bumped on every mutation. Persistence adapters only overwrite a
 * stored row whose version is lower, so a stale copy never clobbers a newer one.
 *
 * @tparam IdType The type of the aggregate root's identifier
 */
template<typename IdType>
class AggregateRoot : public Entity<IdType> {
private:
    int version_ = 0;

protected:
    using Entity<IdType>::Entity;

    void incrementVersion(typename Entity<IdType>::TimePoint at) {
        ++version_;
        this->touch(at);
    }

public:
    /**
     * @brief Get the aggregate version (for optimistic locking)
     */
    [[nodiscard]] int getVersion() const noexcept {
        return version_;
    }

    /**
     * @brief Set the aggregate version (used when loading from persistence)
     */
    void setVersion(int version) {
        version_ = version;
    }
};

} // namespace shared::domain
