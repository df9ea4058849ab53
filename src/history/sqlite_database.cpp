#include "history/sqlite_database.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <sqlite3.h>

namespace {

constexpr int BUSY_TIMEOUT_MS = 5000;

} // namespace

SqliteStatement::SqliteStatement(sqlite3* db, const std::string& sql)
    : db_(db)
    , stmt_(nullptr) {
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
        throw StoreError("prepare failed: " + message + " [" + sql + "]");
    }
}

SqliteStatement::~SqliteStatement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

SqliteStatement::SqliteStatement(SqliteStatement&& other) noexcept
    : db_(other.db_)
    , stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

SqliteStatement& SqliteStatement::operator=(SqliteStatement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        db_ = other.db_;
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
    }
    return *this;
}

void SqliteStatement::check(int rc, const char* what) const {
    if (rc != SQLITE_OK) {
        throw StoreError(std::string(what) + " failed: " + sqlite3_errmsg(db_));
    }
}

SqliteStatement& SqliteStatement::bind(int index, int64_t value) {
    check(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)), "bind");
    return *this;
}

SqliteStatement& SqliteStatement::bind(int index, const std::string& value) {
    check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT), "bind");
    return *this;
}

SqliteStatement& SqliteStatement::bindNull(int index) {
    check(sqlite3_bind_null(stmt_, index), "bind");
    return *this;
}

bool SqliteStatement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    std::string message = sqlite3_errmsg(db_);
    sqlite3_reset(stmt_);
    throw StoreError("step failed: " + message);
}

void SqliteStatement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

int64_t SqliteStatement::columnInt64(int column) const {
    return static_cast<int64_t>(sqlite3_column_int64(stmt_, column));
}

std::string SqliteStatement::columnText(int column) const {
    const unsigned char* text = sqlite3_column_text(stmt_, column);
    if (text == nullptr) {
        return std::string();
    }
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

bool SqliteStatement::columnIsNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

SqliteDatabase::SqliteDatabase(const std::string& path, Mode mode)
    : path_(path) {
    int flags = SQLITE_OPEN_FULLMUTEX;
    flags |= mode == Mode::READ_ONLY ? SQLITE_OPEN_READONLY : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError("cannot open " + path + ": " + message);
    }
    sqlite3_busy_timeout(db_, BUSY_TIMEOUT_MS);
    sqlite3_extended_result_codes(db_, 1);
}

SqliteDatabase::~SqliteDatabase() {
    if (db_) {
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK) {
            Logger::warning("Closing " + path_ + " failed: " + sqlite3_errstr(rc));
            sqlite3_close_v2(db_);
        }
    }
}

void SqliteDatabase::exec(const std::string& sql) {
    char* error = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error);
    if (rc != SQLITE_OK) {
        std::string message = error ? error : sqlite3_errmsg(db_);
        sqlite3_free(error);
        throw StoreError(message);
    }
}

SqliteStatement SqliteDatabase::prepare(const std::string& sql) {
    return SqliteStatement(db_, sql);
}

std::optional<int64_t> SqliteDatabase::queryInt64(const std::string& sql) {
    SqliteStatement stmt(db_, sql);
    if (!stmt.step() || stmt.columnIsNull(0)) {
        return std::nullopt;
    }
    return stmt.columnInt64(0);
}

int64_t SqliteDatabase::lastInsertRowId() const {
    return static_cast<int64_t>(sqlite3_last_insert_rowid(db_));
}

int SqliteDatabase::userVersion() {
    return static_cast<int>(queryInt64("PRAGMA user_version").value_or(0));
}

void SqliteDatabase::setUserVersion(int version) {
    exec("PRAGMA user_version = " + std::to_string(version));
}

SqliteDatabase::Transaction::Transaction(SqliteDatabase& db)
    : db_(db) {
    db_.exec("BEGIN IMMEDIATE");
}

SqliteDatabase::Transaction::~Transaction() {
    if (!done_) {
        try {
            db_.exec("ROLLBACK");
        } catch (const StoreError& e) {
            Logger::error(std::string("Rollback failed: ") + e.what());
        }
    }
}

void SqliteDatabase::Transaction::commit() {
    db_.exec("COMMIT");
    done_ = true;
}
