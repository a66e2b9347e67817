#include "database.hpp"

#include <utility>

#include "logging/logger.hpp"

namespace devauth {
namespace storage {

namespace {

const char kSchema[] = R"sql(
CREATE TABLE IF NOT EXISTS devices (
    device_id        TEXT    PRIMARY KEY NOT NULL,
    user_id          TEXT    NOT NULL,
    derived_key_hash TEXT    NOT NULL,
    sealed_secret    BLOB    NOT NULL,
    is_active        INTEGER NOT NULL DEFAULT 1,
    created_at       INTEGER NOT NULL,
    last_used        INTEGER,
    usage_count      INTEGER NOT NULL DEFAULT 0,
    last_step        INTEGER NOT NULL DEFAULT -1,
    deactivated_at   INTEGER
);
CREATE INDEX IF NOT EXISTS idx_devices_user_id    ON devices(user_id);
CREATE INDEX IF NOT EXISTS idx_devices_is_active  ON devices(is_active);
CREATE INDEX IF NOT EXISTS idx_devices_created_at ON devices(created_at);

CREATE TABLE IF NOT EXISTS audit_logs (
    id              INTEGER PRIMARY KEY AUTOINCREMENT,
    device_id       TEXT    NOT NULL,
    action          TEXT    NOT NULL,
    success         INTEGER NOT NULL,
    timestamp       INTEGER NOT NULL,
    ip_address      TEXT,
    user_agent      TEXT,
    additional_data TEXT
);
CREATE INDEX IF NOT EXISTS idx_audit_logs_device_id ON audit_logs(device_id);
CREATE INDEX IF NOT EXISTS idx_audit_logs_timestamp ON audit_logs(timestamp);
CREATE INDEX IF NOT EXISTS idx_audit_logs_action    ON audit_logs(action);

CREATE TRIGGER IF NOT EXISTS audit_logs_no_update BEFORE UPDATE ON audit_logs
BEGIN
    SELECT RAISE(ABORT, 'audit_logs is append-only');
END;
CREATE TRIGGER IF NOT EXISTS audit_logs_no_delete BEFORE DELETE ON audit_logs
BEGIN
    SELECT RAISE(ABORT, 'audit_logs is append-only');
END;
)sql";

}  // namespace

StorageFault classify_result(int rc) {
    switch (rc & 0xFF) {
        case SQLITE_OK:
        case SQLITE_ROW:
        case SQLITE_DONE:
            return StorageFault::NONE;
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return StorageFault::TIMEOUT;
        case SQLITE_CONSTRAINT:
            return StorageFault::CONSTRAINT;
        default:
            return StorageFault::UNAVAILABLE;
    }
}

//=============================================================================
// Statement
//=============================================================================

int Statement::bind_text(int index, const std::string &text) {
    return sqlite3_bind_text(stmt_.get(), index, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
}

int Statement::bind_int64(int index, int64_t value) { return sqlite3_bind_int64(stmt_.get(), index, value); }

int Statement::bind_blob(int index, const std::vector<uint8_t> &blob) {
    static const uint8_t empty = 0;
    const void *data = blob.empty() ? static_cast<const void *>(&empty) : blob.data();
    return sqlite3_bind_blob(stmt_.get(), index, data, static_cast<int>(blob.size()), SQLITE_TRANSIENT);
}

int Statement::bind_null(int index) { return sqlite3_bind_null(stmt_.get(), index); }

std::string Statement::column_text(int index) const {
    const unsigned char *text = sqlite3_column_text(stmt_.get(), index);
    if (text == nullptr) {
        return "";
    }
    return std::string(reinterpret_cast<const char *>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_.get(), index)));
}

int64_t Statement::column_int64(int index) const { return sqlite3_column_int64(stmt_.get(), index); }

std::vector<uint8_t> Statement::column_blob(int index) const {
    const void *data = sqlite3_column_blob(stmt_.get(), index);
    int size = sqlite3_column_bytes(stmt_.get(), index);
    if (data == nullptr || size <= 0) {
        return {};
    }
    const auto *bytes = static_cast<const uint8_t *>(data);
    return std::vector<uint8_t>(bytes, bytes + size);
}

bool Statement::column_is_null(int index) const { return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL; }

std::optional<int64_t> Statement::column_optional_int64(int index) const {
    if (column_is_null(index)) {
        return std::nullopt;
    }
    return column_int64(index);
}

int Statement::step() { return sqlite3_step(stmt_.get()); }

//=============================================================================
// Connection
//=============================================================================

Connection::~Connection() {
    if (db_ != nullptr) {
        sqlite3_close_v2(db_);
    }
}

std::unique_ptr<Connection> Connection::open(const DatabaseOptions &options, StorageFault &fault,
                                             std::string &error) {
    sqlite3 *db = nullptr;
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
    int rc = sqlite3_open_v2(options.path.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        error = "Cannot open database '" + options.path + "': " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
        fault = StorageFault::UNAVAILABLE;
        if (db != nullptr) {
            sqlite3_close_v2(db);
        }
        return nullptr;
    }

    sqlite3_busy_timeout(db, options.busy_timeout_ms);
    sqlite3_extended_result_codes(db, 1);

    fault = StorageFault::NONE;
    return std::unique_ptr<Connection>(new Connection(db));
}

bool Connection::exec(const std::string &sql, StorageFault &fault, std::string &error) {
    char *errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        error = errmsg != nullptr ? errmsg : sqlite3_errstr(rc);
        sqlite3_free(errmsg);
        fault = classify_result(rc);
        return false;
    }
    return true;
}

Statement Connection::prepare(const std::string &sql, StorageFault &fault, std::string &error) {
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        error = "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_));
        fault = classify_result(rc);
        return Statement();
    }
    return Statement(stmt);
}

int64_t Connection::changes() const { return sqlite3_changes(db_); }

std::string Connection::error_message() const { return sqlite3_errmsg(db_); }

//=============================================================================
// Transaction
//=============================================================================

Transaction::~Transaction() {
    if (active_) {
        StorageFault fault = StorageFault::NONE;
        std::string error;
        if (!conn_.exec("ROLLBACK;", fault, error)) {
            LOG_WARN("[Storage] Rollback failed: " << error);
        }
    }
}

bool Transaction::begin(StorageFault &fault, std::string &error) {
    if (!conn_.exec("BEGIN IMMEDIATE;", fault, error)) {
        return false;
    }
    active_ = true;
    return true;
}

bool Transaction::commit(StorageFault &fault, std::string &error) {
    if (!conn_.exec("COMMIT;", fault, error)) {
        return false;
    }
    active_ = false;
    return true;
}

//=============================================================================
// Database
//=============================================================================

Database::Database(DatabaseOptions options) : options_(std::move(options)) {}

bool Database::initialize(std::string &error) {
    LOG_INFO("[Storage] Opening database: " << options_.path);

    StorageFault fault = StorageFault::NONE;
    auto conn = connect(fault, error);
    if (!conn) {
        return false;
    }

    // WAL lets readers proceed while a writer holds the lock
    if (!conn->exec("PRAGMA journal_mode = WAL;", fault, error)) {
        LOG_WARN("[Storage] WAL not available, continuing with default journal: " << error);
        error.clear();
    }

    if (!conn->exec(kSchema, fault, error)) {
        error = "Schema creation failed: " + error;
        return false;
    }

    LOG_INFO("[Storage] Schema ready (busy timeout " << options_.busy_timeout_ms << "ms)");
    return true;
}

std::unique_ptr<Connection> Database::connect(StorageFault &fault, std::string &error) const {
    return Connection::open(options_, fault, error);
}

bool Database::ping(std::string &error) const {
    StorageFault fault = StorageFault::NONE;
    auto conn = connect(fault, error);
    if (!conn) {
        return false;
    }
    auto stmt = conn->prepare("SELECT 1;", fault, error);
    if (!stmt) {
        return false;
    }
    int rc = stmt.step();
    if (rc != SQLITE_ROW) {
        error = "Health query failed: " + conn->error_message();
        return false;
    }
    return true;
}

}  // namespace storage
}  // namespace devauth
