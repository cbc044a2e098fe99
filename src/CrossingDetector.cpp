/**
 * @file CrossingDetector.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "CrossingDetector.h"
#include "ParticlePool.h"
#include "RateAggregator.h"

CrossingDetector::CrossingDetector(RateAggregator& rates_, CrossingEventQueue& events_)
    : rates(rates_), events(events_) {}

CrossingEvent CrossingDetector::makeEvent(const Particle& p, float radius, bool nowOutside) {
    CrossingEvent e;
    e.kind = nowOutside ? CrossingEvent::Kind::Exit : CrossingEvent::Kind::Enter;
    e.normal = p.position.normalized();
    e.position = e.normal * radius;
    e.age = 0.0f;
    return e;
}

bool CrossingDetector::update(Particle& p, float radius) {
    bool nowOutside = p.position.length() >= radius;
    if (nowOutside == p.outside) return false;
    CrossingEvent e = makeEvent(p, radius, nowOutside);
    rates.record(e.kind);
    events.push(e);
    p.outside = nowOutside;
    return true;
}
