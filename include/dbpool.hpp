#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <type_traits>
#include "logging.hpp"
#include "sqlconnection.hpp"

using PConn = std::shared_ptr<SQLConnection>;

namespace pool {

enum class DbIntent { Read,
    Write };
enum class PoolAcquireError { Timeout,
    Shutdown };

struct PoolStats {
    std::size_t size { 0 };
    std::size_t in_use { 0 };
    std::size_t waiters { 0 };
};

struct AcquirePolicy {
    std::chrono::milliseconds acquire_timeout { 1500 }; // never block forever
};

class IDbPool;

// --------- RAII Lease ----------
class Lease {
public:
    Lease(IDbPool* owner, PConn conn, DbIntent intent)
        : owner_(owner)
        , conn_(std::move(conn))
        , intent_(intent) { }

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    Lease(Lease&& other) noexcept { move_from(other); }
    Lease& operator=(Lease&& other) noexcept {
        if (this != &other) {
            release_();
            move_from(other);
        }
        return *this;
    }

    ~Lease() { release_(); }

    SQLConnection& conn() const { return *conn_; }
    std::shared_ptr<SQLConnection> shared() const { return conn_; }
    DbIntent intent() const { return intent_; }
    explicit operator bool() const { return !!conn_; }

private:
    void release_();
    void move_from(Lease& o) noexcept {
        owner_ = o.owner_;
        o.owner_ = nullptr;
        conn_ = std::move(o.conn_);
        intent_ = o.intent_;
    }

    IDbPool* owner_ { nullptr };
    std::shared_ptr<SQLConnection> conn_ {};
    DbIntent intent_ { DbIntent::Read };

    friend class IDbPool;
};

// --------- Pool interface (polymorphic) ----------
class IDbPool {
public:
    virtual ~IDbPool() = default;

    struct AcquireResult {
        bool ok { false };
        Lease lease { nullptr, nullptr, DbIntent::Read };
        PoolAcquireError error { PoolAcquireError::Timeout };
    };

    virtual AcquireResult acquire(DbIntent intent,
        std::chrono::milliseconds timeoutOverride = std::chrono::milliseconds::zero())
        = 0;

    virtual PoolStats stats() const = 0;
    virtual void shutdown() = 0;
    virtual Dialect dialect() const = 0;

protected:
    // Only pools are allowed to “return” leases:
    virtual void release(std::shared_ptr<SQLConnection> conn, DbIntent intent) = 0;
    friend class Lease;
};

inline void Lease::release_() {
    if (owner_ && conn_) {
        owner_->release(conn_, intent_);
    }
    owner_ = nullptr;
    conn_.reset();
}

// Acquire or throw DbError: Busy on timeout, Connection after shutdown.
inline Lease acquire_or_throw(IDbPool& p, DbIntent intent) {
    auto ac = p.acquire(intent);
    if (!ac.ok) {
        if (ac.error == PoolAcquireError::Shutdown) {
            throw DbError(DbErrorKind::Connection, "connection pool is shut down");
        }
        throw DbError(DbErrorKind::Busy, "timed out waiting for a pooled connection");
    }
    return std::move(ac.lease);
}

// Run fn with a leased connection; the lease is released when fn returns or throws.
template <class F>
auto with_conn(IDbPool& p, DbIntent intent, F&& fn) -> std::invoke_result_t<F, SQLConnection&> {
    Lease lease = acquire_or_throw(p, intent);
    return std::forward<F>(fn)(lease.conn());
}

// Same, inside one transaction: commit on return, rollback on any exception.
template <class F>
auto with_tr(IDbPool& p, DbIntent intent, F&& fn) -> std::invoke_result_t<F, SQLConnection&> {
    Lease lease = acquire_or_throw(p, intent);
    SQLConnection& conn = lease.conn();
    conn.begin(intent == DbIntent::Write);
    try {
        if constexpr (std::is_void_v<std::invoke_result_t<F, SQLConnection&>>) {
            std::forward<F>(fn)(conn);
            conn.commit();
        } else {
            auto result = std::forward<F>(fn)(conn);
            conn.commit();
            return result;
        }
    } catch (...) {
        try {
            conn.rollback();
        } catch (const std::exception& e) {
            RELMAP_LOG_ERROR("rollback failed", { obs::str_field("error", e.what()) });
        }
        throw;
    }
}

} // namespace pool

class DbPool final : public pool::IDbPool {
public:
    DbPool(std::size_t capacity,
        std::string dsn,
        std::function<PSQLConnection()> factory,
        pool::AcquirePolicy policy = {})
        : cap_(capacity)
        , dsn_(std::move(dsn))
        , policy_(policy)
        , factory_(std::move(factory)) { load_(); }

    AcquireResult acquire(
        pool::DbIntent intent,
        std::chrono::milliseconds to = std::chrono::milliseconds::zero()) override {
        auto deadline = std::chrono::steady_clock::now() + (to.count() ? to : policy_.acquire_timeout);

        std::unique_lock<std::mutex> lk(mx_);
        // waiters is only touched with mx_ held
        ++stats_.waiters;
        while (!shutdown_ && free_.empty()) {
            if (cv_.wait_until(lk, deadline) == std::cv_status::timeout && free_.empty()) {
                --stats_.waiters;
                return { false, { nullptr, nullptr, pool::DbIntent::Read }, pool::PoolAcquireError::Timeout };
            }
        }
        --stats_.waiters;
        if (shutdown_) {
            return { false, { nullptr, nullptr, pool::DbIntent::Read }, pool::PoolAcquireError::Shutdown };
        }

        auto conn = std::move(free_.front());
        free_.pop_front();
        ++stats_.in_use;
        lk.unlock();

        // a connection dropped by the store is reopened before it is handed out
        if (!conn->connected()) {
            try {
                conn->connect(dsn_);
            } catch (...) {
                release(conn, intent);
                throw;
            }
        }
        return { true, pool::Lease { this, std::move(conn), intent }, {} };
    }

    pool::PoolStats stats() const override {
        std::lock_guard<std::mutex> lk(mx_);
        auto s = stats_;
        s.size = cap_;
        return s;
    }

    void shutdown() override {
        std::lock_guard<std::mutex> lk(mx_);
        shutdown_ = true;
        cv_.notify_all();
    }

    Dialect dialect() const override { return dialect_; }

protected:
    void release(std::shared_ptr<SQLConnection> conn, pool::DbIntent) override {
        // a lease returned mid-transaction must not leak it to the next holder
        if (conn && conn->in_transaction()) {
            try {
                conn->rollback();
            } catch (const std::exception& e) {
                RELMAP_LOG_WARN("rollback on release failed", { obs::str_field("error", e.what()) });
                conn->disconnect();
            }
        }
        std::lock_guard<std::mutex> lk(mx_);
        if (conn && !shutdown_) {
            free_.push_back(std::move(conn));
        }
        if (stats_.in_use)
            --stats_.in_use;
        cv_.notify_one();
    }

private:
    void load_() {
        std::lock_guard<std::mutex> lk(mx_);
        free_.clear();
        if (cap_ == 0) throw std::invalid_argument("DbPool: capacity must be at least 1");
        for (std::size_t i = 0; i < cap_; ++i) {
            if (!factory_) throw std::invalid_argument("DbPool: null connection factory");
            PSQLConnection up = factory_();
            if (!up) throw std::invalid_argument("DbPool: factory returned null connection");
            up->connect(dsn_);
            dialect_ = up->dialect();
            free_.push_back(PConn(up.release()));
        }
        stats_ = {};
        stats_.size = cap_;
    }

    std::size_t cap_;
    std::string dsn_;
    pool::AcquirePolicy policy_;
    std::function<PSQLConnection()> factory_;
    Dialect dialect_ { Dialect::SQLite };

    mutable std::mutex mx_;
    std::condition_variable cv_;
    std::deque<std::shared_ptr<SQLConnection>> free_;
    bool shutdown_ { false };
    pool::PoolStats stats_;
};

// Pool of `size` connections of the given dialect, each opened on dsn.
std::shared_ptr<pool::IDbPool> make_pool(Dialect dialect, const std::string& dsn, std::size_t size,
    std::chrono::milliseconds acquire_timeout = std::chrono::milliseconds(1500));
