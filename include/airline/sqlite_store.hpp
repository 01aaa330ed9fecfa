#pragma once

#include "airline/inventory_store.hpp"

#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

#include <sqlite3.h>

/**
 * @file sqlite_store.hpp
 * @brief SQLite implementation of the inventory store with a bounded connection pool.
 */

namespace airline {

/**
 * @brief Connection settings for SqliteInventoryStore.
 */
struct SqliteStoreOptions {
    std::string path = "airline.db"; /**< Database file. */
    int pool_size = 8;               /**< Maximum number of open connections. */
    int acquire_timeout_ms = 5000;   /**< How long open_session() waits for a free connection. */
    int busy_timeout_ms = 5000;      /**< How long a statement waits on SQLite's write lock. */
};

class SqliteSession;

/**
 * @brief Inventory store backed by one SQLite database file.
 *
 * @details
 * Connections are opened lazily up to @ref SqliteStoreOptions::pool_size and
 * handed out one per session. The database runs in WAL mode so readers never
 * block the single writer, and transactions start with BEGIN IMMEDIATE so two
 * writers queue on the write lock instead of failing on a lock upgrade.
 */
class SqliteInventoryStore : public InventoryStore {
public:
    explicit SqliteInventoryStore(SqliteStoreOptions options);
    ~SqliteInventoryStore() override;

    SqliteInventoryStore(const SqliteInventoryStore&) = delete;
    SqliteInventoryStore& operator=(const SqliteInventoryStore&) = delete;

    /**
     * @brief Switches the file to WAL mode and creates tables and indexes if missing.
     */
    Status init_schema();

    Result<std::unique_ptr<StoreSession>> open_session() override;

    const SqliteStoreOptions& options() const { return options_; }

private:
    friend class SqliteSession;

    Result<sqlite3*> open_connection();
    Result<sqlite3*> acquire_connection();
    void release_connection(sqlite3* db);

    SqliteStoreOptions options_;

    std::mutex mtx_;
    std::condition_variable cv_;
    std::vector<sqlite3*> idle_; /**< Open connections not leased to any session. */
    int open_count_ = 0;         /**< Idle plus leased connections. */
};

} // namespace airline
