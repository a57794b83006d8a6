#pragma once
#include <cstdint>
#include <mutex>
#include <string>
#include "orm.hpp"

// Produces the values the client computes itself: identities and
// generated-on-create / generated-on-update timestamps.
class ValueGenerator {
public:
    // worker and datacenter ids feed the snowflake layout, 0..31 each
    ValueGenerator(int workerId = 1, int datacenterId = 1);

    // 26 chars, Crockford base32, 48-bit millisecond timestamp + 80 random bits
    static std::string ulid();

    // 41-bit timestamp | 5-bit datacenter | 5-bit worker | 12-bit sequence
    int64_t snowflake();

    // Current UTC time rendered for a temporal type:
    // date "2024-05-01", time "13:45:10", datetime "2024-05-01T13:45:10",
    // timestamp "2024-05-01T13:45:10.123Z".
    static std::string now(PropType type);

private:
    static constexpr uint64_t EPOCH = 1288834974657;
    static constexpr int SEQUENCE_BITS = 12;
    static constexpr int WORKER_ID_BITS = 5;
    static constexpr int DATACENTER_ID_BITS = 5;
    static constexpr int MAX_WORKER_ID = (1 << WORKER_ID_BITS) - 1;
    static constexpr int MAX_DATACENTER_ID = (1 << DATACENTER_ID_BITS) - 1;
    static constexpr int SEQUENCE_MASK = (1 << SEQUENCE_BITS) - 1;
    static constexpr int WORKER_ID_SHIFT = SEQUENCE_BITS;
    static constexpr int DATACENTER_ID_SHIFT = SEQUENCE_BITS + WORKER_ID_BITS;
    static constexpr int TIMESTAMP_SHIFT = SEQUENCE_BITS + WORKER_ID_BITS + DATACENTER_ID_BITS;

    static uint64_t millis();

    int64_t workerId_;
    int64_t datacenterId_;
    uint64_t sequence_ = 0;
    uint64_t lastTimestamp_ = 0;
    std::mutex mutex_;
};
