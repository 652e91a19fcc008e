// cobin run log: short progress lines on stderr, full record in the trace file
// (sections, metrics, decisions and tab-separated tables)

#pragma once

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace cobin {

class Logger {
public:
    explicit Logger(const std::string& command, const std::string& version = "")
        : start_(std::chrono::steady_clock::now()),
          command_(command),
          version_(version) {}

    ~Logger() {
        if (!trace_.is_open()) return;
        trace_ << "\n[" << wall_clock() << "] " << command_ << " finished after "
               << std::fixed << std::setprecision(1) << seconds() << "s";
        if (n_warnings_ > 0) trace_ << ", " << n_warnings_ << " warning(s)";
        trace_ << "\n";
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // False if the file cannot be created; console logging continues
    bool open_trace(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        trace_.open(path);
        if (!trace_.is_open()) return false;
        trace_ << "cobin " << command_;
        if (!version_.empty()) trace_ << " " << version_;
        trace_ << "\nstarted " << wall_clock() << "\n";
        return true;
    }

    void set_verbose(bool verbose) { verbose_ = verbose; }

    void info(const std::string& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cerr << msg << "\n";
        trace("[" + std::to_string(static_cast<int>(seconds())) + "s] " + msg);
    }

    // Trace file always, console only with --verbose
    void detail(const std::string& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (verbose_) std::cerr << "  " << msg << "\n";
        trace("  " + msg);
    }

    void warn(const std::string& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++n_warnings_;
        std::cerr << "Warning: " << msg << "\n";
        trace("[WARN] " + msg);
    }

    void error(const std::string& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cerr << "Error: " << msg << "\n";
        trace("[ERROR] " + msg);
    }

    void section(const std::string& title) {
        std::lock_guard<std::mutex> lock(mutex_);
        trace("\n## " + title);
    }

    void metric(const std::string& name, double value, int precision = 4) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(precision) << value;
        metric(name, ss.str());
    }

    void metric(const std::string& name, int value) {
        metric(name, std::to_string(value));
    }

    void metric(const std::string& name, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        trace("  " + name + ": " + value);
    }

    void decision(const std::string& type, const std::string& outcome,
                  const std::string& reason = "") {
        std::lock_guard<std::mutex> lock(mutex_);
        trace("[DECISION:" + type + "] " + outcome + (reason.empty() ? "" : " (" + reason + ")"));
    }

    void table_header(const std::string& title, const std::vector<std::string>& columns) {
        std::lock_guard<std::mutex> lock(mutex_);
        trace("\n[TABLE:" + title + "]");
        trace(tab_joined(columns));
    }

    void table_row(const std::vector<std::string>& values) {
        std::lock_guard<std::mutex> lock(mutex_);
        trace(tab_joined(values));
    }

private:
    double seconds() const {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
    }

    static std::string wall_clock() {
        std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", std::localtime(&now));
        return buf;
    }

    static std::string tab_joined(const std::vector<std::string>& values) {
        std::string line;
        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0) line += '\t';
            line += values[i];
        }
        return line;
    }

    // Caller holds mutex_
    void trace(const std::string& line) {
        if (!trace_.is_open()) return;
        trace_ << line << "\n";
        trace_.flush();
    }

    std::chrono::steady_clock::time_point start_;
    std::ofstream trace_;
    std::mutex mutex_;
    std::string command_;
    std::string version_;
    bool verbose_ = false;
    int n_warnings_ = 0;
};

}  // namespace cobin
