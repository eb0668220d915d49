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

#ifndef CANCEL_TOKEN_H
#define CANCEL_TOKEN_H

#include <chrono>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>

class CancelledError : public std::runtime_error {
public:
    explicit CancelledError(const std::string& what = "operation cancelled") : std::runtime_error(what) {}
};

class DeadlineExceededError : public CancelledError {
public:
    explicit DeadlineExceededError(const std::string& what = "deadline exceeded") : CancelledError(what) {}
};

// A stop request plus an optional deadline. Every blocking call in a build
// (dequeue wait, cluster watch, log stream, callback) takes one of these.
class CancelToken {
public:
    using clock = std::chrono::steady_clock;

    CancelToken() = default;
    explicit CancelToken(std::stop_token stop,
                         std::optional<clock::time_point> deadline = std::nullopt)
        : stop_(std::move(stop)), deadline_(deadline) {}

    // Child token sharing the stop request, with the earlier of the two deadlines
    [[nodiscard]] CancelToken with_timeout(std::chrono::milliseconds timeout) const;

    [[nodiscard]] bool stop_requested() const { return stop_.stop_requested(); }
    [[nodiscard]] bool expired() const;
    [[nodiscard]] bool done() const { return stop_requested() || expired(); }

    // Throws DeadlineExceededError or CancelledError once done()
    void check() const;

    [[nodiscard]] std::optional<std::chrono::milliseconds> remaining() const;
    [[nodiscard]] std::optional<clock::time_point> deadline() const { return deadline_; }
    [[nodiscard]] const std::stop_token& stop_token() const { return stop_; }

    // Sleeps for up to `duration`; returns false if woken by stop or deadline
    bool sleep_for(std::chrono::milliseconds duration) const;

private:
    std::stop_token stop_;
    std::optional<clock::time_point> deadline_;
};

#endif // CANCEL_TOKEN_H
