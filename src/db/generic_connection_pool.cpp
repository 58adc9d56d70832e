#include "db/generic_connection_pool.hpp"
#include "core/utils.hpp"
#include <format>

namespace sqlgate {

GenericConnectionPool::GenericConnectionPool(
    std::string db_name,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory)
    : db_name_(std::move(db_name)),
      config_(config),
      factory_(std::move(factory)),
      semaphore_(static_cast<std::ptrdiff_t>(config.max_connections)) {

    // Pre-warm pool with min_connections
    for (size_t i = 0; i < config_.min_connections; ++i) {
        auto conn = create_connection();
        if (!conn) {
            utils::log::warn(std::format(
                "Failed to create connection {} during pool initialization for database '{}'",
                i + 1, db_name_));
            continue;
        }
        std::lock_guard lock(mutex_);
        idle_connections_.emplace_back(std::move(conn));
    }

    utils::log::debug(std::format("ConnectionPool initialized for database '{}': {} connections (min={}, max={})",
        db_name_, total_connections_.load(), config_.min_connections, config_.max_connections));
}

GenericConnectionPool::~GenericConnectionPool() {
    drain();
}

std::unique_ptr<PooledConnection> GenericConnectionPool::acquire(
    std::chrono::milliseconds timeout) {

    if (shutdown_.load(std::memory_order_acquire)) {
        return nullptr;
    }

    // Blocks while every permit is borrowed
    if (!semaphore_.try_acquire_for(timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Timed out after {}ms waiting for a connection to '{}'",
            timeout.count(), db_name_));
        return nullptr;
    }

    // Shutdown may have started while waiting for the permit
    if (shutdown_.load(std::memory_order_acquire)) {
        semaphore_.release();
        return nullptr;
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    std::unique_ptr<IDbConnection> conn;
    Clock::time_point birth{};
    Clock::time_point last_used{};
    {
        std::lock_guard lock(mutex_);
        if (!idle_connections_.empty()) {
            conn = std::move(idle_connections_.front());
            idle_connections_.pop_front();
            birth = created_at_[conn.get()];
            last_used = last_used_[conn.get()];
        }
    }

    if (!conn) {
        conn = create_connection();
        birth = last_used = Clock::now();
    } else if (config_.max_lifetime.count() > 0 && Clock::now() - birth > config_.max_lifetime) {
        connections_recycled_.fetch_add(1, std::memory_order_relaxed);
        conn = replace_connection(std::move(conn));
    } else if (Clock::now() - last_used > config_.idle_timeout &&
               !conn->is_healthy(config_.health_check_query)) {
        // Recently used connections skip the round trip
        health_check_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Idle connection to '{}' failed its health check", db_name_));
        conn = replace_connection(std::move(conn));
    }

    if (!conn) {
        semaphore_.release();
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    auto return_fn = [this](std::unique_ptr<IDbConnection> c) {
        this->return_connection(std::move(c));
    };

    return std::make_unique<PooledConnection>(std::move(conn), return_fn);
}

PoolStats GenericConnectionPool::get_stats() const {
    std::lock_guard lock(mutex_);

    PoolStats stats;
    stats.total_connections = total_connections_.load(std::memory_order_relaxed);
    stats.idle_connections = idle_connections_.size();
    stats.active_connections = stats.total_connections - stats.idle_connections;
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.total_releases = total_releases_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    stats.connections_recycled = connections_recycled_.load(std::memory_order_relaxed);
    return stats;
}

void GenericConnectionPool::drain() {
    if (shutdown_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    std::lock_guard lock(mutex_);
    for (auto& conn : idle_connections_) {
        if (conn) {
            conn->close();
            total_connections_.fetch_sub(1, std::memory_order_relaxed);
        }
    }

    idle_connections_.clear();
    created_at_.clear();
    last_used_.clear();

    utils::log::debug(std::format("ConnectionPool drained for database '{}'", db_name_));
}

std::unique_ptr<IDbConnection> GenericConnectionPool::create_connection() {
    auto conn = factory_->create(config_.connection_string);
    if (!conn) {
        utils::log::error(std::format("Could not open a connection to database '{}'", db_name_));
        return nullptr;
    }

    total_connections_.fetch_add(1, std::memory_order_relaxed);
    const auto now = Clock::now();
    std::lock_guard lock(mutex_);
    created_at_[conn.get()] = now;
    last_used_[conn.get()] = now;
    return conn;
}

std::unique_ptr<IDbConnection> GenericConnectionPool::replace_connection(
    std::unique_ptr<IDbConnection> conn) {
    discard_connection(std::move(conn));
    return create_connection();
}

void GenericConnectionPool::discard_connection(std::unique_ptr<IDbConnection> conn) {
    {
        std::lock_guard lock(mutex_);
        created_at_.erase(conn.get());
        last_used_.erase(conn.get());
    }
    conn->close();
    total_connections_.fetch_sub(1, std::memory_order_relaxed);
}

void GenericConnectionPool::return_connection(std::unique_ptr<IDbConnection> conn) {
    if (!conn) {
        return;
    }

    total_releases_.fetch_add(1, std::memory_order_relaxed);

    if (shutdown_.load(std::memory_order_acquire) || !conn->is_connected()) {
        discard_connection(std::move(conn));
        semaphore_.release();
        return;
    }

    {
        std::lock_guard lock(mutex_);
        last_used_[conn.get()] = Clock::now();
        idle_connections_.emplace_back(std::move(conn));
    }

    semaphore_.release();
}

} // namespace sqlgate
