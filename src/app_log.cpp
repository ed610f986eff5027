#include "app_log.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace {

std::mutex g_log_mtx;
std::ofstream g_log_file;
std::string g_log_path;

std::string timestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace

bool AppLog::open(const std::string& dir, const std::string& file_name, std::string& error) {
    std::filesystem::path path = file_name.empty() ? std::filesystem::path("app.log") : std::filesystem::path(file_name);
    if (!dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            error = "failed to create logs directory " + dir + ": " + ec.message();
            return false;
        }
        path = std::filesystem::path(dir) / path;
    }

    std::lock_guard<std::mutex> lock(g_log_mtx);
    if (g_log_file.is_open()) g_log_file.close();
    g_log_file.open(path, std::ios::out | std::ios::app);
    if (!g_log_file) {
        error = "failed to open log file " + path.string();
        return false;
    }
    g_log_path = path.string();
    return true;
}

void AppLog::close() {
    std::lock_guard<std::mutex> lock(g_log_mtx);
    if (g_log_file.is_open()) {
        g_log_file.flush();
        g_log_file.close();
    }
    g_log_path.clear();
}

bool AppLog::is_open() {
    std::lock_guard<std::mutex> lock(g_log_mtx);
    return g_log_file.is_open();
}

std::string AppLog::file_path() {
    std::lock_guard<std::mutex> lock(g_log_mtx);
    return g_log_path;
}

void AppLog::write(bool is_error, const std::string& tag, const std::string& message) {
    std::string line = timestamp() + " [" + tag + "] " + message;

    std::lock_guard<std::mutex> lock(g_log_mtx);
    if (is_error) {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << std::endl;
    }
    if (g_log_file.is_open()) {
        g_log_file << line << '\n';
        g_log_file.flush();
    }
}
