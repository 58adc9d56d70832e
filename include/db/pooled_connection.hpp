#pragma once

#include "db/idb_connection.hpp"
#include <functional>
#include <memory>

namespace sqlgate {

/**
 * @brief RAII handle for a connection borrowed from a pool
 *
 * Returns the connection to its pool on destruction, on every exit path
 * of the request that borrowed it. Move-only.
 */
class PooledConnection {
public:
    using ReturnFunc = std::function<void(std::unique_ptr<IDbConnection>)>;

    PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn);
    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }
    IDbConnection& operator*() const { return *conn_; }

    bool is_valid() const { return conn_ != nullptr && conn_->is_connected(); }

private:
    void give_back();

    std::unique_ptr<IDbConnection> conn_;
    ReturnFunc return_fn_;
};

} // namespace sqlgate
