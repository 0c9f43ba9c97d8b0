#pragma once

#include "db/idb_connection.hpp"
#include <functional>
#include <memory>

namespace sqlgate {

/**
 * @brief Checked-out connection that goes back to its pool on destruction
 *
 * Move-only. A connection that failed at the transport level can be
 * flagged with mark_broken(); the pool then closes it instead of keeping
 * it idle.
 */
class PooledConnection {
public:
    using ReturnFunc = std::function<void(std::unique_ptr<IDbConnection>, bool broken)>;

    PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn);
    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }

    bool is_valid() const { return conn_ != nullptr && conn_->is_connected(); }

    /**
     * @brief Do not recycle this connection when it is returned
     */
    void mark_broken() { broken_ = true; }

private:
    void give_back();

    std::unique_ptr<IDbConnection> conn_;
    ReturnFunc return_fn_;
    bool broken_ = false;
};

} // namespace sqlgate
