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

#ifndef HTTP_CLIENT_H
#define HTTP_CLIENT_H

#include "cancel_token.h"

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

class HttpError : public std::runtime_error {
public:
    explicit HttpError(const std::string& what, long status = 0)
        : std::runtime_error(what), status_(status) {}

    long status() const { return status_; }

private:
    long status_;
};

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::string> headers;  // "Name: value"
    std::string body;

    std::string bearer_token;
    std::string basic_user;
    std::string basic_password;

    // TLS material, either as files or as PEM text
    std::string ca_file;
    std::string ca_data;
    std::string client_cert_file;
    std::string client_key_file;
    std::string client_cert_data;
    std::string client_key_data;
    bool insecure = false;

    std::optional<std::chrono::milliseconds> timeout;
};

struct HttpResponse {
    long status = 0;
    std::map<std::string, std::string> headers;  // names lower-cased
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
    std::optional<std::string> header(const std::string& name) const;
};

// Thin libcurl wrapper. Every transfer polls the CancelToken from curl's
// progress callback, so a stop request or deadline aborts it mid-flight.
// Instances hold no per-transfer state and are safe to share across threads.
class HttpClient {
public:
    HttpClient();
    virtual ~HttpClient() = default;

    // Buffers the whole response. Throws HttpError on transport failure,
    // CancelledError / DeadlineExceededError when the token fires.
    virtual HttpResponse perform(const HttpRequest& request, const CancelToken& token) const;

    // Delivers a 2xx body line by line; `on_line` returns false to stop early.
    // For non-2xx answers the body is buffered into the returned response.
    // An exception thrown by `on_line` ends the transfer and propagates.
    virtual HttpResponse stream_lines(const HttpRequest& request, const CancelToken& token,
                                      const std::function<bool(const std::string& line)>& on_line) const;
};

#endif // HTTP_CLIENT_H
