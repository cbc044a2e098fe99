/**
 * @file CrossingEventQueue.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "CrossingEventQueue.h"

CrossingEventQueue::CrossingEventQueue(size_t capacity, float ttlSeconds)
    : cap(capacity), ttlS(ttlSeconds) {}

void CrossingEventQueue::push(const CrossingEvent& e) {
    if (cap == 0) return;
    while (events.size() >= cap) events.pop_front();
    events.push_back(e);
}

void CrossingEventQueue::age(float delta) {
    if (!(delta > 0.0f)) return;
    for (auto& e : events) e.age += delta;
    // Front is always the oldest, so expiry only ever happens at the front.
    while (!events.empty() && events.front().age > ttlS) events.pop_front();
}
