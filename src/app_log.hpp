#pragma once
#include <sstream>
#include <string>

// Process-wide log sink. Lines go to stdout (errors to stderr) and, once
// open() succeeded, are appended to the log file as well.
class AppLog {
public:
    // Creates dir if needed and opens dir/file_name for appending.
    static bool open(const std::string& dir, const std::string& file_name, std::string& error);
    static void close();
    static bool is_open();
    static std::string file_path();

    static void write(bool is_error, const std::string& tag, const std::string& message);
};

class LogLine {
public:
    LogLine(const char* tag, bool is_error) : tag_(tag), is_error_(is_error) {}
    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;
    ~LogLine() { AppLog::write(is_error_, tag_, ss_.str()); }

    template <typename T>
    LogLine& operator<<(const T& v) {
        ss_ << v;
        return *this;
    }

private:
    const char* tag_;
    bool is_error_;
    std::ostringstream ss_;
};

inline LogLine log_info(const char* tag) { return LogLine(tag, false); }
inline LogLine log_error(const char* tag) { return LogLine(tag, true); }
