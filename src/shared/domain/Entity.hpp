/**
 * @file Entity.hpp
 * @brief Base class for Entities in DDD
 */

#pragma once

#include <chrono>
#include <utility>

namespace shared::domain {

/**
 * @brief Base template class for Entities
 *
 * Entities are defined by their identity, not by their attributes.
 * Repositories hand out snapshots, so entities are copyable; identity
 * comparison is what makes two snapshots "the same" entity.
 *
 * @tparam IdType The type of the entity's identifier
 */
template<typename IdType>
class Entity {
public:
    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

protected:
    IdType id_;
    TimePoint createdAt_;
    TimePoint updatedAt_;

    explicit Entity(IdType id, TimePoint createdAt = Clock::now())
        : id_(std::move(id)),
          createdAt_(createdAt),
          updatedAt_(createdAt) {}

    /**
     * @brief Update the modification timestamp
     */
    void touch(TimePoint at = Clock::now()) {
        updatedAt_ = at;
    }

public:
    virtual ~Entity() = default;

    Entity(const Entity&) = default;
    Entity& operator=(const Entity&) = default;
    Entity(Entity&&) noexcept = default;
    Entity& operator=(Entity&&) noexcept = default;

    [[nodiscard]] const IdType& getId() const noexcept {
        return id_;
    }

    [[nodiscard]] TimePoint getCreatedAt() const noexcept {
        return createdAt_;
    }

    [[nodiscard]] TimePoint getUpdatedAt() const noexcept {
        return updatedAt_;
    }

    bool operator==(const Entity& other) const {
        return id_ == other.id_;
    }

    bool operator!=(const Entity& other) const {
        return !(*this == other);
    }
};

} // namespace shared::domain
