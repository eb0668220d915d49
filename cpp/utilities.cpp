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

#include "utilities.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iostream>
#include <random>
#include <stdexcept>

bool verbose = false;

// Build threads log concurrently; keep each line whole
static std::mutex log_mutex;

// Function to generate a random string of given length
std::string generate_random_string(size_t length) {
    const std::string chars =
        "abcdefghijklmnopqrstuvwxyz"
        "0123456789";
    thread_local std::mt19937 rg{std::random_device{}()};
    thread_local std::uniform_int_distribution<> pick(0, chars.size() - 1);
    std::string s;
    s.reserve(length);
    while (length--)
        s += chars[pick(rg)];
    return s;
}

// Function to get current UTC time formatted as per the given format string
std::string get_current_utc_time(const std::string& format) {
    auto now = std::chrono::system_clock::now();
    std::time_t now_time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_utc;
    gmtime_r(&now_time, &tm_utc);
    char buf[64];
    std::strftime(buf, sizeof(buf), format.c_str(), &tm_utc);
    return std::string(buf);
}

std::string format_rfc3339(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_utc;
    gmtime_r(&t, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
    return std::string(buf);
}

std::chrono::milliseconds parse_duration(const std::string& value) {
    if (value.empty()) throw std::invalid_argument("empty duration");

    size_t pos = 0;
    while (pos < value.size() && (std::isdigit(static_cast<unsigned char>(value[pos])) || value[pos] == '.')) ++pos;
    if (pos == 0) throw std::invalid_argument("invalid duration: " + value);

    const std::string number = value.substr(0, pos);
    size_t used = 0;
    double amount = std::stod(number, &used);
    if (used != number.size()) throw std::invalid_argument("invalid duration: " + value);
    std::string unit = value.substr(pos);
    double millis;
    if (unit.empty() || unit == "s") millis = amount * 1000.0;
    else if (unit == "ms") millis = amount;
    else if (unit == "m") millis = amount * 60.0 * 1000.0;
    else if (unit == "h") millis = amount * 3600.0 * 1000.0;
    else throw std::invalid_argument("invalid duration unit: " + value);

    // Past this the cast to an integer count is undefined
    if (millis >= static_cast<double>(std::chrono::milliseconds::max().count())) {
        throw std::out_of_range("duration too large: " + value);
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(millis));
}

std::string remove_prefix(const std::string& input, const std::string& prefix) {
    if (input.starts_with(prefix)) {
        return input.substr(prefix.size());
    }
    return input;
}

std::string to_lower(std::string input) {
    std::transform(input.begin(), input.end(), input.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return input;
}

// Logger function implementations
void log_info(const std::string &msg) {
    std::lock_guard<std::mutex> lock(log_mutex);
    std::cout << get_current_utc_time("%Y-%m-%dT%H:%M:%SZ") << " [INFO] " << msg << "\n";
}

void log_warning(const std::string &msg) {
    std::lock_guard<std::mutex> lock(log_mutex);
    std::cerr << get_current_utc_time("%Y-%m-%dT%H:%M:%SZ") << " [WARNING] " << msg << "\n";
}

void log_error(const std::string &msg) {
    std::lock_guard<std::mutex> lock(log_mutex);
    std::cerr << get_current_utc_time("%Y-%m-%dT%H:%M:%SZ") << " [ERROR] " << msg << "\n";
}

void log_verbose(const std::string &msg) {
    if (verbose) {
        std::lock_guard<std::mutex> lock(log_mutex);
        std::cout << get_current_utc_time("%Y-%m-%dT%H:%M:%SZ") << " [VERBOSE] " << msg << "\n";
    }
}
