#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "log_store.hpp"

#define CSV_HEADER "start_time,end_time,app_name,window_title"

// Row-oriented activity log, one record per line:
//   start_time,end_time,app_name,window_title
// Line breaks inside app names and titles are written as spaces.
// Also reads the change-point format of earlier trackers (app_name,title,timestamp).
class CsvLogStore : public LogStore {
  public:
    explicit CsvLogStore(std::filesystem::path path);

    void PrepareForAppend() override;
    void Append(const ActivityInterval &interval) override;
    LogReadResult ReadAll(const DateRange &range = DateRange::All()) override;
    std::string Describe() const override;

    static std::string EscapeField(const std::string &field);
    static std::string FormatRecord(const ActivityInterval &interval);

    struct Record {
        std::vector<std::string> fields;
        std::size_t line = 0;
        bool complete = true;
        bool unterminatedQuote = false;
    };
    static std::vector<Record> ParseRecords(const std::string &content);

  private:
    void ReadIntervals(const std::vector<Record> &records, std::size_t first,
                       LogReadResult &result) const;
    void ReadLegacyChangePoints(const std::vector<Record> &records, std::size_t first,
                                LogReadResult &result) const;
    void SkipRecord(std::size_t line, const std::string &reason, LogReadResult &result) const;

  private:
    std::filesystem::path m_Path;
};
