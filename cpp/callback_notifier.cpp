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

#include "callback_notifier.h"
#include "utilities.h"

#include <format>

CallbackNotifier::CallbackNotifier(std::string api_key, std::chrono::milliseconds timeout,
                                   std::shared_ptr<HttpClient> http)
    : api_key_(std::move(api_key)), timeout_(timeout), http_(std::move(http)) {}

void CallbackNotifier::notify(const std::string& url, const BuildResult& result, const CancelToken& token) {
    HttpRequest request;
    request.method = "POST";
    request.url = url;
    request.headers.push_back("Content-Type: application/json");
    request.body = result.to_json_string();
    request.bearer_token = api_key_;
    request.timeout = timeout_;

    HttpResponse response = http_->perform(request, token);
    if (!response.ok()) {
        throw HttpError(std::format("Callback to {} returned HTTP {}", url, response.status), response.status);
    }
    log_verbose(std::format("Callback for {} delivered to {}", short_id(result.job_id), url));
}
