#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace devauth {
namespace storage {

// Coarse classification of SQLite result codes
enum class StorageFault {
    NONE,
    TIMEOUT,      // SQLITE_BUSY / SQLITE_LOCKED after busy_timeout elapsed
    CONSTRAINT,   // UNIQUE / PRIMARY KEY violation
    UNAVAILABLE   // Anything else (I/O, corrupt, cannot open, misuse)
};

StorageFault classify_result(int rc);

struct DatabaseOptions {
    std::string path = "devauth.db";
    int busy_timeout_ms = 5000;  // Upper bound on waiting for a lock
};

/**
 * @brief RAII wrapper around a prepared statement
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt *stmt) : stmt_(stmt, sqlite3_finalize) {}

    sqlite3_stmt *get() const { return stmt_.get(); }
    explicit operator bool() const { return stmt_ != nullptr; }

    // Bind helpers (1-based index); return SQLite result code
    int bind_text(int index, const std::string &text);
    int bind_int64(int index, int64_t value);
    int bind_blob(int index, const std::vector<uint8_t> &blob);
    int bind_null(int index);

    // Column getters (0-based index)
    std::string column_text(int index) const;
    int64_t column_int64(int index) const;
    std::vector<uint8_t> column_blob(int index) const;
    bool column_is_null(int index) const;
    std::optional<int64_t> column_optional_int64(int index) const;

    // SQLITE_ROW, SQLITE_DONE or an error code
    int step();

private:
    std::shared_ptr<sqlite3_stmt> stmt_;
};

/**
 * @brief One SQLite connection
 *
 * Connections are short-lived: each storage operation opens its own, so
 * concurrent requests never share transaction state and all coordination
 * happens inside SQLite (file locks, constraints, conditional updates).
 */
class Connection {
public:
    ~Connection();

    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;

    // Returns nullptr and sets fault/error on failure
    static std::unique_ptr<Connection> open(const DatabaseOptions &options, StorageFault &fault, std::string &error);

    // Executes one or more statements without results
    bool exec(const std::string &sql, StorageFault &fault, std::string &error);

    // Returns an empty Statement on failure
    Statement prepare(const std::string &sql, StorageFault &fault, std::string &error);

    int64_t changes() const;
    std::string error_message() const;

    sqlite3 *get() const { return db_; }

private:
    explicit Connection(sqlite3 *db) : db_(db) {}

    sqlite3 *db_ = nullptr;
};

/**
 * @brief Scoped BEGIN IMMEDIATE ... COMMIT
 *
 * IMMEDIATE takes the write lock up front so check-then-write sequences are
 * linearized across connections. Rolls back on destruction unless committed.
 */
class Transaction {
public:
    explicit Transaction(Connection &conn) : conn_(conn) {}
    ~Transaction();

    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

    bool begin(StorageFault &fault, std::string &error);
    bool commit(StorageFault &fault, std::string &error);

private:
    Connection &conn_;
    bool active_ = false;
};

/**
 * @brief Schema owner and connection factory for the devauth store
 */
class Database {
public:
    explicit Database(DatabaseOptions options);

    // Creates tables and indexes (idempotent) and enables WAL
    bool initialize(std::string &error);

    std::unique_ptr<Connection> connect(StorageFault &fault, std::string &error) const;

    // SELECT 1 round trip
    bool ping(std::string &error) const;

    const DatabaseOptions &options() const { return options_; }

private:
    DatabaseOptions options_;
};

}  // namespace storage
}  // namespace devauth
