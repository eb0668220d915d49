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

#include "http_client.h"
#include "utilities.h"

#include <cstring>
#include <exception>
#include <format>
#include <memory>
#include <mutex>

#include <curl/curl.h>

namespace {

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

struct Transfer {
    const CancelToken* token = nullptr;
    CURL* curl = nullptr;
    HttpResponse response;

    // Streaming mode
    const std::function<bool(const std::string&)>* on_line = nullptr;
    std::string pending;
    bool stopped_by_consumer = false;
    // Thrown by on_line; held until curl_easy_perform has returned
    std::exception_ptr line_error;
};

int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* transfer = static_cast<Transfer*>(clientp);
    return transfer->token->done() ? 1 : 0;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* transfer = static_cast<Transfer*>(userdata);
    const size_t total = size * nitems;
    std::string line(buffer, total);

    // A new status line starts a new header block (redirects, 100 Continue)
    if (line.starts_with("HTTP/")) {
        transfer->response.headers.clear();
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string::npos) return total;
    std::string name = to_lower(line.substr(0, colon));
    std::string value = line.substr(colon + 1);
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) value.erase(0, 1);
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) value.pop_back();
    transfer->response.headers[name] = value;
    return total;
}

size_t write_buffered(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* transfer = static_cast<Transfer*>(userdata);
    transfer->response.body.append(ptr, size * nmemb);
    return size * nmemb;
}

size_t write_lines(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* transfer = static_cast<Transfer*>(userdata);
    const size_t total = size * nmemb;

    long status = 0;
    curl_easy_getinfo(transfer->curl, CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        transfer->response.body.append(ptr, total);
        return total;
    }

    transfer->pending.append(ptr, total);
    size_t start = 0;
    size_t newline;
    while ((newline = transfer->pending.find('\n', start)) != std::string::npos) {
        std::string line = transfer->pending.substr(start, newline - start);
        start = newline + 1;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        bool more = false;
        try {
            more = (*transfer->on_line)(line);
        } catch (...) {
            transfer->line_error = std::current_exception();
            return 0;
        }
        if (!more) {
            transfer->stopped_by_consumer = true;
            return 0;
        }
    }
    transfer->pending.erase(0, start);
    return total;
}

void set_blob(CURL* curl, CURLoption option, const std::string& data) {
    curl_blob blob;
    blob.data = const_cast<char*>(data.data());
    blob.len = data.size();
    blob.flags = CURL_BLOB_COPY;
    curl_easy_setopt(curl, option, &blob);
}

HeaderList configure(CURL* curl, const HttpRequest& request, Transfer& transfer, char* error_buffer) {
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 10000L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);

    if (request.method == "HEAD") {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    } else if (request.method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }
    if (!request.body.empty() || request.method == "POST" || request.method == "PUT" || request.method == "PATCH") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    }

    curl_slist* raw_headers = nullptr;
    for (const auto& header : request.headers) {
        raw_headers = curl_slist_append(raw_headers, header.c_str());
    }
    if (!request.bearer_token.empty()) {
        const std::string auth = "Authorization: Bearer " + request.bearer_token;
        raw_headers = curl_slist_append(raw_headers, auth.c_str());
    }
    HeaderList headers(raw_headers);
    if (headers) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());

    if (!request.basic_user.empty()) {
        curl_easy_setopt(curl, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(curl, CURLOPT_USERNAME, request.basic_user.c_str());
        curl_easy_setopt(curl, CURLOPT_PASSWORD, request.basic_password.c_str());
    }

    if (!request.ca_file.empty()) curl_easy_setopt(curl, CURLOPT_CAINFO, request.ca_file.c_str());
    if (!request.ca_data.empty()) set_blob(curl, CURLOPT_CAINFO_BLOB, request.ca_data);
    if (!request.client_cert_file.empty()) curl_easy_setopt(curl, CURLOPT_SSLCERT, request.client_cert_file.c_str());
    if (!request.client_key_file.empty()) curl_easy_setopt(curl, CURLOPT_SSLKEY, request.client_key_file.c_str());
    if (!request.client_cert_data.empty()) set_blob(curl, CURLOPT_SSLCERT_BLOB, request.client_cert_data);
    if (!request.client_key_data.empty()) set_blob(curl, CURLOPT_SSLKEY_BLOB, request.client_key_data);
    if (request.insecure) {
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
    }
    if (request.timeout) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout->count()));
    }

    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &transfer);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &transfer);
    return headers;
}

HttpResponse run(const HttpRequest& request, const CancelToken& token,
                 const std::function<bool(const std::string&)>* on_line) {
    token.check();

    CurlHandle curl(curl_easy_init());
    if (!curl) throw HttpError("Failed to initialize CURL");

    Transfer transfer;
    transfer.token = &token;
    transfer.curl = curl.get();
    transfer.on_line = on_line;

    char error_buffer[CURL_ERROR_SIZE];
    error_buffer[0] = '\0';
    HeaderList headers = configure(curl.get(), request, transfer, error_buffer);

    if (on_line) curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_lines);
    else curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_buffered);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &transfer);

    CURLcode res = curl_easy_perform(curl.get());
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &transfer.response.status);
    if (transfer.line_error) std::rethrow_exception(transfer.line_error);

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        token.check();
        throw CancelledError("transfer aborted: " + request.url);
    }
    if (res == CURLE_WRITE_ERROR && transfer.stopped_by_consumer) {
        return transfer.response;
    }
    if (res != CURLE_OK) {
        std::string detail = error_buffer[0] ? error_buffer : curl_easy_strerror(res);
        throw HttpError(std::format("{} {} failed: {}", request.method, request.url, detail));
    }

    // Trailing line without a newline
    if (on_line && !transfer.pending.empty() && transfer.response.ok()) {
        (*on_line)(transfer.pending);
    }
    return transfer.response;
}

} // namespace

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    if (it == headers.end()) return std::nullopt;
    return it->second;
}

HttpClient::HttpClient() {
    static std::once_flag curl_init_flag;
    std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse HttpClient::perform(const HttpRequest& request, const CancelToken& token) const {
    return run(request, token, nullptr);
}

HttpResponse HttpClient::stream_lines(const HttpRequest& request, const CancelToken& token,
                                      const std::function<bool(const std::string& line)>& on_line) const {
    return run(request, token, &on_line);
}
