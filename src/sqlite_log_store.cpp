#include "sqlite_log_store.hpp"

#include <spdlog/spdlog.h>

#include "errors.hpp"

namespace {

// ─────────────────────────────────────
struct SqliteStmt {
    sqlite3_stmt *stmt = nullptr;
    ~SqliteStmt() {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }
    sqlite3_stmt **out() { return &stmt; }
    sqlite3_stmt *get() const { return stmt; }
    SqliteStmt(const SqliteStmt &) = delete;
    SqliteStmt &operator=(const SqliteStmt &) = delete;
    SqliteStmt() = default;
};

// ─────────────────────────────────────
std::string ColumnText(sqlite3_stmt *stmt, int col) {
    const unsigned char *txt = sqlite3_column_text(stmt, col);
    return txt ? reinterpret_cast<const char *>(txt) : "";
}

} // namespace

// ─────────────────────────────────────
SQLiteLogStore::SQLiteLogStore(std::filesystem::path path) : m_Path(std::move(path)) {}

// ─────────────────────────────────────
SQLiteLogStore::~SQLiteLogStore() {
    Close();
}

// ─────────────────────────────────────
std::string SQLiteLogStore::Describe() const {
    return "SQLite log " + m_Path.string();
}

// ─────────────────────────────────────
void SQLiteLogStore::Close() {
    if (m_InsertStmt) {
        sqlite3_finalize(m_InsertStmt);
        m_InsertStmt = nullptr;
    }
    if (m_Db) {
        sqlite3_close(m_Db);
        m_Db = nullptr;
    }
    m_Writable = false;
}

// ─────────────────────────────────────
void SQLiteLogStore::Open(int flags) {
    Close();
    if (sqlite3_open_v2(m_Path.c_str(), &m_Db, flags, nullptr) != SQLITE_OK) {
        const std::string reason = m_Db ? sqlite3_errmsg(m_Db) : "out of memory";
        Close();
        spdlog::error("unable to open database: {}", m_Path.string());
        throw PersistenceError("cannot open database " + m_Path.string() + ": " + reason);
    }
    spdlog::debug("SQLite database opened: {}", m_Path.string());

    sqlite3_busy_timeout(m_Db, 2000);
    m_Writable = (flags & SQLITE_OPEN_READWRITE) != 0;
    if (m_Writable) {
        ExecIgnoringErrors("PRAGMA journal_mode=WAL");
        ExecIgnoringErrors("PRAGMA synchronous=FULL");
    }
}

// ─────────────────────────────────────
void SQLiteLogStore::Init() {
    Exec("CREATE TABLE IF NOT EXISTS activity_log ("
         "start_time REAL NOT NULL,"
         "end_time REAL NOT NULL,"
         "app_name TEXT NOT NULL,"
         "window_title TEXT NOT NULL DEFAULT ''"
         ")");
    Exec("CREATE INDEX IF NOT EXISTS activity_log_start ON activity_log(start_time)");
}

// ─────────────────────────────────────
void SQLiteLogStore::PrepareStatements() {
    const char *sql = R"(
        INSERT INTO activity_log
        (start_time, end_time, app_name, window_title)
        VALUES (?, ?, ?, ?)
    )";
    if (sqlite3_prepare_v2(m_Db, sql, -1, &m_InsertStmt, nullptr) != SQLITE_OK) {
        m_InsertStmt = nullptr;
        throw PersistenceError(std::string("db prepare failed for insert stmt: ") +
                               sqlite3_errmsg(m_Db));
    }
}

// ─────────────────────────────────────
void SQLiteLogStore::PrepareForAppend() {
    if (m_Db && m_Writable && m_InsertStmt) {
        return;
    }
    Open(SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    Init();
    PrepareStatements();
}

// ─────────────────────────────────────
void SQLiteLogStore::Append(const ActivityInterval &interval) {
    if (interval.end <= interval.start) {
        throw PersistenceError("refusing to store an interval that does not advance");
    }
    PrepareForAppend();

    sqlite3_reset(m_InsertStmt);
    sqlite3_clear_bindings(m_InsertStmt);

    sqlite3_bind_double(m_InsertStmt, 1, interval.start);
    sqlite3_bind_double(m_InsertStmt, 2, interval.end);
    sqlite3_bind_text(m_InsertStmt, 3, interval.app.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(m_InsertStmt, 4, interval.title.c_str(), -1, SQLITE_TRANSIENT);

    const int rc = sqlite3_step(m_InsertStmt);
    if (rc != SQLITE_DONE) {
        throw PersistenceError(std::string("insert into activity_log failed: ") +
                               sqlite3_errmsg(m_Db));
    }
    spdlog::debug("Inserted interval: app={}, title={}, duration={:.1f}", interval.app,
                  interval.title, interval.Duration());
}

// ─────────────────────────────────────
LogReadResult SQLiteLogStore::ReadAll(const DateRange &range) {
    LogReadResult result;

    std::error_code ec;
    if (!std::filesystem::exists(m_Path, ec)) {
        spdlog::info("Activity log {} does not exist yet", m_Path.string());
        return result;
    }
    if (!m_Db) {
        Open(SQLITE_OPEN_READONLY);
    }

    // Overlap test: start < range.end AND end > range.start. Unbounded sides are dropped.
    std::string sql = "SELECT start_time, end_time, app_name, window_title FROM activity_log";
    const bool bounded = range.IsBounded();
    if (bounded) {
        sql += " WHERE start_time < ? AND end_time > ?";
    }
    sql += " ORDER BY start_time";

    SqliteStmt stmt;
    if (sqlite3_prepare_v2(m_Db, sql.c_str(), -1, stmt.out(), nullptr) != SQLITE_OK) {
        throw PersistenceError("cannot read activity log " + m_Path.string() + ": " +
                               sqlite3_errmsg(m_Db));
    }
    if (bounded) {
        sqlite3_bind_double(stmt.get(), 1, range.end);
        sqlite3_bind_double(stmt.get(), 2, range.start);
    }

    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        if (sqlite3_column_type(stmt.get(), 0) == SQLITE_NULL ||
            sqlite3_column_type(stmt.get(), 1) == SQLITE_NULL ||
            sqlite3_column_type(stmt.get(), 2) == SQLITE_NULL) {
            ++result.skipped;
            continue;
        }
        ActivityInterval interval{sqlite3_column_double(stmt.get(), 0),
                                  sqlite3_column_double(stmt.get(), 1),
                                  ColumnText(stmt.get(), 2), ColumnText(stmt.get(), 3)};
        if (interval.end <= interval.start) {
            ++result.skipped;
            continue;
        }
        result.intervals.push_back(std::move(interval));
    }
    if (rc != SQLITE_DONE) {
        throw PersistenceError("error while reading activity log " + m_Path.string() + ": " +
                               sqlite3_errmsg(m_Db));
    }

    FilterAndSort(result, range);
    if (result.skipped > 0) {
        spdlog::warn("Skipped {} malformed row(s) in {}", result.skipped, m_Path.string());
    }
    spdlog::debug("Fetched {} interval(s) from {}", result.intervals.size(), m_Path.string());
    return result;
}

// ─────────────────────────────────────
void SQLiteLogStore::Exec(const std::string &sql) {
    char *errmsg = nullptr;
    if (sqlite3_exec(m_Db, sql.c_str(), nullptr, nullptr, &errmsg) != SQLITE_OK) {
        const std::string reason = errmsg ? errmsg : sqlite3_errmsg(m_Db);
        sqlite3_free(errmsg);
        throw PersistenceError("sqlite exec error on " + m_Path.string() + ": " + reason);
    }
}

// ─────────────────────────────────────
void SQLiteLogStore::ExecIgnoringErrors(const std::string &sql) {
    char *errmsg = nullptr;
    sqlite3_exec(m_Db, sql.c_str(), nullptr, nullptr, &errmsg);
    if (errmsg) {
        spdlog::warn("sqlite exec error: {}", errmsg);
        sqlite3_free(errmsg);
    }
}
