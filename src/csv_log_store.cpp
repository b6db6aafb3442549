#include "csv_log_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <optional>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include "errors.hpp"
#include "local_time.hpp"

namespace {

// ─────────────────────────────────────
struct LockedFile {
    int fd = -1;
    ~LockedFile() {
        if (fd >= 0) {
            ::flock(fd, LOCK_UN);
            ::close(fd);
        }
    }
    LockedFile(const LockedFile &) = delete;
    LockedFile &operator=(const LockedFile &) = delete;
    LockedFile() = default;
};

// ─────────────────────────────────────
std::string ErrnoMessage(const std::string &what, const std::filesystem::path &path) {
    return what + " " + path.string() + ": " + std::strerror(errno);
}

// ─────────────────────────────────────
bool WriteAll(int fd, const std::string &data) {
    const char *ptr = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        const ssize_t n = ::write(fd, ptr, remaining);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        ptr += static_cast<std::size_t>(n);
        remaining -= static_cast<std::size_t>(n);
    }
    return true;
}

// ─────────────────────────────────────
bool IsLegacyHeader(const std::vector<std::string> &fields) {
    return fields.size() >= 3 && fields[0] == "app_name" && fields[1] == "title" &&
           fields[2] == "timestamp";
}

// ─────────────────────────────────────
bool IsIntervalHeader(const std::vector<std::string> &fields) {
    return fields.size() >= 4 && fields[0] == "start_time" && fields[1] == "end_time" &&
           fields[2] == "app_name" && fields[3] == "window_title";
}

// ─────────────────────────────────────
std::string SingleLine(const std::string &field) {
    std::string out = field;
    std::replace_if(out.begin(), out.end(), [](char c) { return c == '\r' || c == '\n'; }, ' ');
    return out;
}

// Splits one physical line into fields. Quoted fields never span lines.
// ─────────────────────────────────────
CsvLogStore::Record ParseLine(const std::string &line) {
    CsvLogStore::Record record;
    std::string field;
    bool in_quotes = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (in_quotes) {
            if (c != '"') {
                field.push_back(c);
            } else if (i + 1 < line.size() && line[i + 1] == '"') {
                field.push_back('"');
                ++i;
            } else {
                in_quotes = false;
            }
        } else if (c == '"' && field.empty()) {
            in_quotes = true;
        } else if (c == ',') {
            record.fields.push_back(std::move(field));
            field.clear();
        } else {
            field.push_back(c);
        }
    }
    record.fields.push_back(std::move(field));
    record.unterminatedQuote = in_quotes;
    return record;
}

// ─────────────────────────────────────
bool IsIdleMarker(const std::string &app) {
    return app == "_pause" || app == "_exit";
}

// Opens the log for appending under an exclusive lock and returns its size. Refuses files
// in the legacy change-point format so the two layouts never mix.
off_t OpenLockedForAppend(const std::filesystem::path &path, LockedFile &file) {
    file.fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (file.fd < 0) {
        throw PersistenceError(ErrnoMessage("cannot open activity log", path));
    }

    int rc = 0;
    do {
        rc = ::flock(file.fd, LOCK_EX);
    } while (rc != 0 && errno == EINTR);
    if (rc != 0) {
        throw PersistenceError(ErrnoMessage("cannot lock activity log", path));
    }

    struct stat st;
    if (::fstat(file.fd, &st) != 0) {
        throw PersistenceError(ErrnoMessage("cannot stat activity log", path));
    }
    if (st.st_size == 0) {
        return 0;
    }

    char head[256];
    const ssize_t n = ::pread(file.fd, head, sizeof(head), 0);
    if (n < 0) {
        throw PersistenceError(ErrnoMessage("cannot read activity log", path));
    }
    std::string first_line(head, static_cast<std::size_t>(n));
    first_line = first_line.substr(0, first_line.find('\n'));
    const auto records = CsvLogStore::ParseRecords(first_line + "\n");
    if (!records.empty() && IsLegacyHeader(records.front().fields)) {
        throw PersistenceError("activity log " + path.string() +
                               " uses the legacy change-point format and is read-only; "
                               "track into a new log file");
    }
    return st.st_size;
}

} // namespace

// ─────────────────────────────────────
CsvLogStore::CsvLogStore(std::filesystem::path path) : m_Path(std::move(path)) {}

// ─────────────────────────────────────
std::string CsvLogStore::Describe() const {
    return "CSV log " + m_Path.string();
}

// ─────────────────────────────────────
std::string CsvLogStore::EscapeField(const std::string &field) {
    if (field.find_first_of(",\"") == std::string::npos) {
        return field;
    }
    std::string out;
    out.reserve(field.size() + 2);
    out.push_back('"');
    for (char c : field) {
        if (c == '"') {
            out.push_back('"');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

// ─────────────────────────────────────
std::string CsvLogStore::FormatRecord(const ActivityInterval &interval) {
    return fmt::format("{},{},{},{}\n", interval.start, interval.end,
                       EscapeField(SingleLine(interval.app)),
                       EscapeField(SingleLine(interval.title)));
}

// ─────────────────────────────────────
void CsvLogStore::PrepareForAppend() {
    LockedFile file;
    const off_t size = OpenLockedForAppend(m_Path, file);
    if (size == 0) {
        if (!WriteAll(file.fd, CSV_HEADER "\n") || ::fsync(file.fd) != 0) {
            throw PersistenceError(ErrnoMessage("cannot write header to", m_Path));
        }
        spdlog::info("Created new activity log: {}", m_Path.string());
    }
}

// ─────────────────────────────────────
void CsvLogStore::Append(const ActivityInterval &interval) {
    LockedFile file;
    const off_t size = OpenLockedForAppend(m_Path, file);

    std::string record;
    if (size == 0) {
        record = CSV_HEADER "\n";
    } else {
        // A crash mid-append can leave a torn last line; start on a fresh one so the torn
        // bytes stay a single malformed record.
        char last = '\n';
        if (::pread(file.fd, &last, 1, size - 1) == 1 && last != '\n') {
            spdlog::warn("Activity log {} ends with a partial record", m_Path.string());
            record = "\n";
        }
    }
    record += FormatRecord(interval);

    if (!WriteAll(file.fd, record)) {
        throw PersistenceError(ErrnoMessage("cannot append to", m_Path));
    }
    if (::fsync(file.fd) != 0) {
        throw PersistenceError(ErrnoMessage("cannot sync", m_Path));
    }
}

// ─────────────────────────────────────
std::vector<CsvLogStore::Record> CsvLogStore::ParseRecords(const std::string &content) {
    std::vector<Record> records;
    std::size_t line = 0;
    std::size_t pos = 0;

    while (pos < content.size()) {
        const std::size_t newline = content.find('\n', pos);
        const bool terminated = newline != std::string::npos;
        std::string text = content.substr(pos, terminated ? newline - pos : std::string::npos);
        pos = terminated ? newline + 1 : content.size();
        ++line;

        if (!text.empty() && text.back() == '\r') {
            text.pop_back();
        }
        if (text.empty()) {
            continue;
        }

        Record record = ParseLine(text);
        record.line = line;
        // Every record we write ends with a newline; an unterminated last line is partial.
        record.complete = terminated;
        records.push_back(std::move(record));
    }
    return records;
}

// ─────────────────────────────────────
void CsvLogStore::SkipRecord(std::size_t line, const std::string &reason,
                             LogReadResult &result) const {
    ++result.skipped;
    spdlog::warn("Skipping malformed record at line {} of {}: {}", line, m_Path.string(), reason);
}

// ─────────────────────────────────────
void CsvLogStore::ReadIntervals(const std::vector<Record> &records, std::size_t first,
                                LogReadResult &result) const {
    for (std::size_t i = first; i < records.size(); ++i) {
        const Record &r = records[i];
        if (!r.complete) {
            SkipRecord(r.line, "partial record", result);
            continue;
        }
        if (r.unterminatedQuote) {
            SkipRecord(r.line, "unterminated quoted field", result);
            continue;
        }
        if (r.fields.size() < 4) {
            SkipRecord(r.line, "expected 4 fields, got " + std::to_string(r.fields.size()), result);
            continue;
        }
        if (IsIntervalHeader(r.fields)) {
            // Repeated header, e.g. two logs concatenated.
            continue;
        }

        const auto start = ParseTimestamp(r.fields[0]);
        const auto end = ParseTimestamp(r.fields[1]);
        if (!start.has_value() || !end.has_value()) {
            SkipRecord(r.line, "invalid timestamp", result);
            continue;
        }
        if (*end <= *start) {
            SkipRecord(r.line, "end_time is not after start_time", result);
            continue;
        }
        result.intervals.push_back(ActivityInterval{*start, *end, r.fields[2], r.fields[3]});
    }
}

// Legacy rows mark the moment focus moved to (app, title); the next row ends it.
// ─────────────────────────────────────
void CsvLogStore::ReadLegacyChangePoints(const std::vector<Record> &records, std::size_t first,
                                         LogReadResult &result) const {
    std::optional<Sample> previous;
    std::size_t previous_line = 0;

    for (std::size_t i = first; i < records.size(); ++i) {
        const Record &r = records[i];
        if (!r.complete) {
            SkipRecord(r.line, "partial record", result);
            continue;
        }
        if (r.unterminatedQuote) {
            SkipRecord(r.line, "unterminated quoted field", result);
            continue;
        }
        if (r.fields.size() < 3) {
            SkipRecord(r.line, "expected 3 fields, got " + std::to_string(r.fields.size()), result);
            continue;
        }
        const auto ts = ParseTimestamp(r.fields[2]);
        if (!ts.has_value()) {
            SkipRecord(r.line, "invalid timestamp", result);
            continue;
        }

        if (previous.has_value() && !IsIdleMarker(previous->app)) {
            ActivityInterval interval{previous->timestamp, *ts, previous->app, previous->title};
            if (interval.Duration() > 0.0) {
                result.intervals.push_back(std::move(interval));
            } else {
                SkipRecord(previous_line, "next change-point does not advance the timestamp",
                           result);
            }
        }
        previous = Sample{*ts, r.fields[0], r.fields[1]};
        previous_line = r.line;
    }
}

// ─────────────────────────────────────
LogReadResult CsvLogStore::ReadAll(const DateRange &range) {
    LogReadResult result;

    std::error_code ec;
    if (!std::filesystem::exists(m_Path, ec)) {
        spdlog::info("Activity log {} does not exist yet", m_Path.string());
        return result;
    }
    if (std::filesystem::is_directory(m_Path, ec)) {
        throw PersistenceError("activity log " + m_Path.string() + " is a directory");
    }

    std::ifstream file(m_Path, std::ios::binary);
    if (!file.is_open()) {
        throw PersistenceError(ErrnoMessage("cannot read activity log", m_Path));
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw PersistenceError(ErrnoMessage("error while reading activity log", m_Path));
    }

    const auto records = ParseRecords(content);
    std::size_t first = 0;
    bool legacy = false;
    if (!records.empty() && records.front().complete) {
        const auto &fields = records.front().fields;
        legacy = IsLegacyHeader(fields);
        if (legacy || IsIntervalHeader(fields)) {
            first = 1;
        }
    }

    if (legacy) {
        spdlog::info("Reading legacy change-point log {}", m_Path.string());
        ReadLegacyChangePoints(records, first, result);
    } else {
        ReadIntervals(records, first, result);
    }

    FilterAndSort(result, range);
    if (result.skipped > 0) {
        spdlog::warn("Skipped {} malformed record(s) in {}", result.skipped, m_Path.string());
    }
    spdlog::debug("Read {} interval(s) from {}", result.intervals.size(), m_Path.string());
    return result;
}
