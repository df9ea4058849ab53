#pragma once

#include <cstdint>
#include <optional>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

// Prepared statement bound to a SqliteDatabase. Throws StoreError on failure.
class SqliteStatement {
public:
    SqliteStatement(sqlite3* db, const std::string& sql);
    ~SqliteStatement();

    SqliteStatement(SqliteStatement&& other) noexcept;
    SqliteStatement& operator=(SqliteStatement&& other) noexcept;
    SqliteStatement(const SqliteStatement&) = delete;
    SqliteStatement& operator=(const SqliteStatement&) = delete;

    // Parameters are 1-based as in SQLite.
    SqliteStatement& bind(int index, int64_t value);
    SqliteStatement& bind(int index, const std::string& value);
    SqliteStatement& bindNull(int index);

    // True while a row is available.
    bool step();
    void reset();

    int64_t columnInt64(int column) const;
    std::string columnText(int column) const;
    bool columnIsNull(int column) const;

private:
    void check(int rc, const char* what) const;

    sqlite3* db_;
    sqlite3_stmt* stmt_;
};

class SqliteDatabase {
public:
    enum class Mode {
        READ_WRITE,
        READ_ONLY
    };

    SqliteDatabase(const std::string& path, Mode mode = Mode::READ_WRITE);
    ~SqliteDatabase();

    SqliteDatabase(const SqliteDatabase&) = delete;
    SqliteDatabase& operator=(const SqliteDatabase&) = delete;

    void exec(const std::string& sql);
    SqliteStatement prepare(const std::string& sql);

    // First column of the first row, or nullopt when there is no row or it is NULL.
    std::optional<int64_t> queryInt64(const std::string& sql);

    int64_t lastInsertRowId() const;
    int userVersion();
    void setUserVersion(int version);
    const std::string& path() const { return path_; }

    // BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless committed.
    class Transaction {
    public:
        explicit Transaction(SqliteDatabase& db);
        ~Transaction();
        void commit();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

    private:
        SqliteDatabase& db_;
        bool done_{false};
    };

private:
    sqlite3* db_{nullptr};
    std::string path_;
};
