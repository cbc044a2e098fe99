/**
 * @file CrossingEventQueue.h
 * @brief Crossing events and the bounded, time-to-live queue that holds them for burst rendering.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "Vec3.h"

#include <cstddef>
#include <deque>

/** @brief Transient record of one genuine membrane crossing. */
struct CrossingEvent {
    enum class Kind { Enter, Exit };
    Kind kind{Kind::Enter};
    Vec3 position;   /**< snapshot on the membrane surface */
    Vec3 normal;     /**< outward unit normal at @ref position */
    float age{0.0f}; /**< seconds since emission */
};

/**
 * @class CrossingEventQueue
 * @brief Oldest-first queue; events older than the TTL are evicted, and the oldest is dropped when full.
 */
class CrossingEventQueue {
public:
    static constexpr size_t DefaultCapacity = 80;
    static constexpr float DefaultTtl = 0.35f;

    explicit CrossingEventQueue(size_t capacity = DefaultCapacity, float ttlSeconds = DefaultTtl);

    void push(const CrossingEvent& e);
    /** @brief Age every event by @p delta and evict those past the TTL. */
    void age(float delta);
    void clear() { events.clear(); }

    size_t size() const { return events.size(); }
    bool empty() const { return events.empty(); }
    size_t capacity() const { return cap; }
    float ttl() const { return ttlS; }
    /** @brief Events ordered oldest first. */
    const std::deque<CrossingEvent>& items() const { return events; }

private:
    std::deque<CrossingEvent> events;
    size_t cap;
    float ttlS;
};
