#pragma once
#include <string>
#include <fstream>
#include <iostream>
#include <filesystem>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>

// Process-wide log. Until init() is called only WARN/ERROR reach stderr,
// so tests and library callers do not create log files.
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    static void init(const std::string& dir = "logs") { instance().do_init(dir); }
    static void info(const std::string& msg)  { instance().log("INFO",  msg, false); }
    static void warn(const std::string& msg)  { instance().log("WARN",  msg, true);  }
    static void error(const std::string& msg) { instance().log("ERROR", msg, true);  }
    static std::string path() {
        std::lock_guard<std::mutex> lock(instance().m_mutex);
        return instance().m_path;
    }

private:
    std::mutex m_mutex;  // workers log concurrently
    std::ofstream m_file;
    std::string m_path;

    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static std::string format_now(const char* fmt) {
        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &t);
#else
        localtime_r(&t, &tm_buf);
#endif
        std::ostringstream ss;
        ss << std::put_time(&tm_buf, fmt);
        return ss.str();
    }

    void do_init(const std::string& dir_name) {
        namespace fs = std::filesystem;
        std::lock_guard<std::mutex> lock(m_mutex);
        fs::path dir = dir_name;
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            std::cerr << "[Logger] cannot create " << dir_name << ": " << ec.message() << "\n";
            return;
        }
        std::string filename = "featscan_" + format_now("%Y%m%d_%H%M%S") + ".log";
        m_path = (dir / filename).string();
        m_file.open(m_path, std::ios::out | std::ios::trunc);
        if (!m_file.is_open()) {
            std::cerr << "[Logger] cannot open " << m_path << "\n";
            m_path.clear();
        }
    }

    void log(const char* level, const std::string& msg, bool also_stderr) {
        std::string line = "[" + format_now("%Y-%m-%d %H:%M:%S") + "] [" + level + "] " + msg;
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_file.is_open()) {
            m_file << line << "\n";
            m_file.flush();
        }
        if (also_stderr) {
            std::cerr << line << "\n";
        }
    }
};
