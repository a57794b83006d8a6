#include "generators.hpp"
#include <chrono>
#include <ctime>
#include <random>
#include "lib.hpp"

ValueGenerator::ValueGenerator(int workerId, int datacenterId)
    : workerId_(workerId)
    , datacenterId_(datacenterId) {
    if (workerId_ > MAX_WORKER_ID || workerId_ < 0) {
        THROW("Worker ID must be between 0 and %d", MAX_WORKER_ID);
    }
    if (datacenterId_ > MAX_DATACENTER_ID || datacenterId_ < 0) {
        THROW("Datacenter ID must be between 0 and %d", MAX_DATACENTER_ID);
    }
}

uint64_t ValueGenerator::millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string ValueGenerator::ulid() {
    static const char* CROCKFORD = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
    thread_local std::mt19937_64 gen { std::random_device {}() };

    const uint64_t timestamp = millis();
    const uint64_t rand_hi = gen();
    const uint16_t rand_lo = static_cast<uint16_t>(gen());

    uint8_t bytes[16] = {};
    for (int i = 0; i < 6; ++i) {
        bytes[i] = (timestamp >> (40 - 8 * i)) & 0xFF;
    }
    for (int i = 0; i < 8; ++i) {
        bytes[6 + i] = (rand_hi >> (56 - 8 * i)) & 0xFF;
    }
    bytes[14] = (rand_lo >> 8) & 0xFF;
    bytes[15] = rand_lo & 0xFF;

    // 128 bits as 26 base32 digits; the first digit carries the top 3 bits
    char out[27] = {};
    int bit = -2;
    for (int i = 0; i < 26; ++i) {
        int idx = 0;
        for (int j = 0; j < 5; ++j) {
            idx <<= 1;
            const int b = bit + j;
            if (b >= 0) {
                idx |= (bytes[b / 8] >> (7 - (b % 8))) & 0x01;
            }
        }
        out[i] = CROCKFORD[idx];
        bit += 5;
    }
    return std::string(out, 26);
}

int64_t ValueGenerator::snowflake() {
    std::lock_guard<std::mutex> lock(mutex_);

    uint64_t timestamp = millis();
    if (timestamp < lastTimestamp_) {
        THROW("Clock moved backwards. Refusing to generate ID for %llu milliseconds",
            static_cast<unsigned long long>(lastTimestamp_ - timestamp));
    }

    if (timestamp == lastTimestamp_) {
        sequence_ = (sequence_ + 1) & SEQUENCE_MASK;
        if (sequence_ == 0) {
            // sequence exhausted for this millisecond
            while (timestamp <= lastTimestamp_) {
                timestamp = millis();
            }
        }
    } else {
        sequence_ = 0;
    }
    lastTimestamp_ = timestamp;

    const uint64_t id = ((timestamp - EPOCH) << TIMESTAMP_SHIFT)
        | (static_cast<uint64_t>(datacenterId_) << DATACENTER_ID_SHIFT)
        | (static_cast<uint64_t>(workerId_) << WORKER_ID_SHIFT)
        | sequence_;
    return static_cast<int64_t>(id);
}

std::string ValueGenerator::now(PropType type) {
    const auto tp = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;

    std::tm utc {};
    gmtime_r(&secs, &utc);

    const char* fmt = "%Y-%m-%dT%H:%M:%S";
    if (type == PropType::Date) fmt = "%Y-%m-%d";
    else if (type == PropType::Time) fmt = "%H:%M:%S";

    char buf[32];
    std::strftime(buf, sizeof(buf), fmt, &utc);
    std::string out(buf);
    if (type == PropType::Tm_Stamp) {
        char frac[8];
        std::snprintf(frac, sizeof(frac), ".%03dZ", static_cast<int>(ms));
        out += frac;
    }
    return out;
}
