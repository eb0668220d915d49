// Copyright (C) 2025 Simon Quigley <tsimonq2@ubuntu.com>
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#pragma once

#include <chrono>
#include <format>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

// Time utilities
std::string get_current_utc_time(const std::string& format);
std::string format_rfc3339(std::chrono::system_clock::time_point tp);

// Parses "30m", "5s", "250ms", "1h" or a bare number of seconds
std::chrono::milliseconds parse_duration(const std::string& value);

// Per-build log buffer. Every line is timestamped and forwarded to the sink,
// which the processor points at the queue's log stream.
class Log {
public:
    using Sink = std::function<void(const std::string& line)>;

    Log() = default;
    explicit Log(Sink sink) : sink_(std::move(sink)) {}

    void append(const std::string& str) {
        std::string line = str;
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();
        if (line.empty()) return;
        {
            std::unique_lock lock(lock_);
            data += std::format("[{}] {}\n", get_current_utc_time("%Y-%m-%dT%H:%M:%SZ"), line);
        }
        if (sink_) sink_(line);
    }

    std::string get() const {
        std::shared_lock lock(lock_);
        return data;
    }

private:
    std::string data = "";
    mutable std::shared_mutex lock_;
    Sink sink_;
};

// String utilities
std::string remove_prefix(const std::string& input, const std::string& prefix);
std::string generate_random_string(size_t length);
std::string to_lower(std::string input);

// Logger functions
extern bool verbose;
void log_info(const std::string &msg);
void log_warning(const std::string &msg);
void log_error(const std::string &msg);
void log_verbose(const std::string &msg);
