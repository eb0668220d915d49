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

#ifndef CALLBACK_NOTIFIER_H
#define CALLBACK_NOTIFIER_H

#include "build_types.h"
#include "http_client.h"

#include <chrono>
#include <memory>
#include <string>

// POSTs a finished BuildResult to the job's webhook. One attempt only.
class CallbackNotifier {
public:
    CallbackNotifier(std::string api_key, std::chrono::milliseconds timeout,
                     std::shared_ptr<HttpClient> http = std::make_shared<HttpClient>());
    virtual ~CallbackNotifier() = default;

    // Throws HttpError for transport errors and non-2xx answers
    virtual void notify(const std::string& url, const BuildResult& result, const CancelToken& token);

private:
    std::string api_key_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<HttpClient> http_;
};

#endif // CALLBACK_NOTIFIER_H
