#include "dbpool.hpp"

std::shared_ptr<pool::IDbPool> make_pool(Dialect dialect, const std::string& dsn, std::size_t size,
    std::chrono::milliseconds acquire_timeout) {
    pool::AcquirePolicy policy;
    policy.acquire_timeout = acquire_timeout;
    auto p = std::make_shared<DbPool>(
        size, dsn, [dialect]() { return make_connection(dialect); }, policy);
    RELMAP_LOG_INFO("connection pool ready",
        { obs::str_field("dialect", to_string(dialect)), obs::int_field("size", static_cast<int64_t>(size)) });
    return p;
}
