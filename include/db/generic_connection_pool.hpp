#pragma once

#include "db/iconnection_pool.hpp"
#include "db/iconnection_factory.hpp"
#include "db/pooled_connection.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <unordered_map>

namespace sqlgate {

/**
 * @brief Database-agnostic bounded connection pool
 *
 * - max_connections enforced via counting_semaphore; a borrowed connection
 *   holds one permit until its PooledConnection is destroyed
 * - connections created lazily up to max, min_connections pre-warmed
 * - connections idle longer than idle_timeout are health-checked on acquire
 * - connections older than max_lifetime are recycled on acquire
 * - connections returned in a broken state are closed instead of reused
 */
class GenericConnectionPool : public IConnectionPool {
public:
    /**
     * @param db_name Database name (for logging)
     * @param config Pool configuration
     * @param factory Connection factory (creates IDbConnection instances)
     */
    GenericConnectionPool(
        std::string db_name,
        const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory);

    ~GenericConnectionPool() override;

    std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) override;

    PoolStats get_stats() const override;

    void drain() override;

    const std::string& name() const override { return db_name_; }

private:
    using Clock = std::chrono::steady_clock;

    std::unique_ptr<IDbConnection> create_connection();

    // Close `conn`, forget its bookkeeping and open a fresh one (nullptr on failure)
    std::unique_ptr<IDbConnection> replace_connection(std::unique_ptr<IDbConnection> conn);

    void discard_connection(std::unique_ptr<IDbConnection> conn);

    void return_connection(std::unique_ptr<IDbConnection> conn);

    std::string db_name_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    // Connection storage
    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    mutable std::mutex mutex_;

    std::counting_semaphore<> semaphore_;

    // Statistics (atomic for lock-free reads)
    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<size_t> connections_recycled_{0};

    std::atomic<bool> shutdown_{false};

    // Lifetime tracking, guarded by mutex_
    std::unordered_map<IDbConnection*, Clock::time_point> created_at_;
    std::unordered_map<IDbConnection*, Clock::time_point> last_used_;
};

} // namespace sqlgate
