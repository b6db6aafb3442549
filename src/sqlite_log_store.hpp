#pragma once

#include <sqlite3.h>

#include <filesystem>
#include <string>

#include "log_store.hpp"

// Activity log in a single SQLite table:
//   activity_log(start_time REAL, end_time REAL, app_name TEXT, window_title TEXT)
class SQLiteLogStore : public LogStore {
  public:
    explicit SQLiteLogStore(std::filesystem::path path);
    ~SQLiteLogStore() override;

    SQLiteLogStore(const SQLiteLogStore &) = delete;
    SQLiteLogStore &operator=(const SQLiteLogStore &) = delete;

    void PrepareForAppend() override;
    void Append(const ActivityInterval &interval) override;
    LogReadResult ReadAll(const DateRange &range = DateRange::All()) override;
    std::string Describe() const override;

  private:
    void Open(int flags);
    void Close();
    void Init();
    void PrepareStatements();
    void Exec(const std::string &sql);
    void ExecIgnoringErrors(const std::string &sql);

  private:
    std::filesystem::path m_Path;
    sqlite3 *m_Db = nullptr;
    sqlite3_stmt *m_InsertStmt = nullptr;
    bool m_Writable = false;
};
