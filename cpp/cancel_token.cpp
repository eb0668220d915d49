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

#include "cancel_token.h"

#include <condition_variable>
#include <mutex>

CancelToken CancelToken::with_timeout(std::chrono::milliseconds timeout) const {
    auto candidate = clock::now() + timeout;
    if (deadline_ && *deadline_ < candidate) candidate = *deadline_;
    return CancelToken(stop_, candidate);
}

bool CancelToken::expired() const {
    return deadline_ && clock::now() >= *deadline_;
}

void CancelToken::check() const {
    if (expired()) throw DeadlineExceededError();
    if (stop_requested()) throw CancelledError();
}

std::optional<std::chrono::milliseconds> CancelToken::remaining() const {
    if (!deadline_) return std::nullopt;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - clock::now());
    if (left.count() < 0) return std::chrono::milliseconds(0);
    return left;
}

bool CancelToken::sleep_for(std::chrono::milliseconds duration) const {
    auto wait = duration;
    if (auto left = remaining(); left && *left < wait) wait = *left;

    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait_for(lock, stop_, wait, [] { return false; });
    return !done();
}
