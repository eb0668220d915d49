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

#include "registry_client.h"
#include "utilities.h"

#include <format>
#include <stdexcept>

#include <QJsonDocument>
#include <QJsonObject>
#include <QUrl>

namespace {

const char* manifest_accept =
    "Accept: application/vnd.oci.image.index.v1+json, "
    "application/vnd.oci.image.manifest.v1+json, "
    "application/vnd.docker.distribution.manifest.list.v2+json, "
    "application/vnd.docker.distribution.manifest.v2+json";

std::string encode(const std::string& value) {
    return QUrl::toPercentEncoding(QString::fromStdString(value)).toStdString();
}

} // namespace

std::string ImageReference::manifest_url() const {
    std::string host = registry == "docker.io" ? "registry-1.docker.io" : registry;
    const bool plain = host.starts_with("localhost") || host.starts_with("127.0.0.1");
    return std::format("{}://{}/v2/{}/manifests/{}", plain ? "http" : "https", host, repository, tag);
}

ImageReference parse_image_reference(const std::string& reference) {
    if (reference.empty()) throw std::invalid_argument("Empty image reference");

    ImageReference ref;
    std::string rest = reference;

    // Digest references: name@sha256:...
    auto at = rest.find('@');
    if (at != std::string::npos) {
        ref.tag = rest.substr(at + 1);
        rest = rest.substr(0, at);
    } else {
        auto colon = rest.rfind(':');
        auto slash = rest.rfind('/');
        if (colon != std::string::npos && (slash == std::string::npos || colon > slash)) {
            ref.tag = rest.substr(colon + 1);
            rest = rest.substr(0, colon);
        } else {
            ref.tag = "latest";
        }
    }

    auto slash = rest.find('/');
    std::string first = slash == std::string::npos ? "" : rest.substr(0, slash);
    if (!first.empty() && (first.find('.') != std::string::npos || first.find(':') != std::string::npos
                           || first == "localhost")) {
        ref.registry = first;
        ref.repository = rest.substr(slash + 1);
    } else {
        ref.registry = "docker.io";
        ref.repository = slash == std::string::npos ? "library/" + rest : rest;
    }
    if (ref.repository.empty() || ref.tag.empty()) {
        throw std::invalid_argument("Invalid image reference: " + reference);
    }
    return ref;
}

std::map<std::string, std::string> parse_auth_challenge(const std::string& header) {
    std::map<std::string, std::string> params;
    std::string rest = header;
    auto space = rest.find(' ');
    if (space == std::string::npos) return params;
    params["scheme"] = to_lower(rest.substr(0, space));
    rest = rest.substr(space + 1);

    size_t pos = 0;
    while (pos < rest.size()) {
        while (pos < rest.size() && (rest[pos] == ' ' || rest[pos] == ',')) ++pos;
        auto eq = rest.find('=', pos);
        if (eq == std::string::npos) break;
        std::string key = to_lower(rest.substr(pos, eq - pos));
        pos = eq + 1;
        std::string value;
        if (pos < rest.size() && rest[pos] == '"') {
            auto end = rest.find('"', pos + 1);
            if (end == std::string::npos) end = rest.size();
            value = rest.substr(pos + 1, end - pos - 1);
            pos = end + 1;
        } else {
            auto end = rest.find(',', pos);
            if (end == std::string::npos) end = rest.size();
            value = rest.substr(pos, end - pos);
            pos = end;
        }
        params[key] = value;
    }
    return params;
}

RegistryClient::RegistryClient(std::string user, std::string password, std::shared_ptr<HttpClient> http)
    : user_(std::move(user)), password_(std::move(password)), http_(std::move(http)) {}

HttpResponse RegistryClient::head_manifest(const ImageReference& ref, const std::string& bearer,
                                           const CancelToken& token) const {
    HttpRequest request;
    request.method = "HEAD";
    request.url = ref.manifest_url();
    request.headers.push_back(manifest_accept);
    request.timeout = std::chrono::seconds(30);
    if (!bearer.empty()) {
        request.bearer_token = bearer;
    } else if (!user_.empty()) {
        request.basic_user = user_;
        request.basic_password = password_;
    }
    return http_->perform(request, token);
}

std::string RegistryClient::fetch_token(const std::string& challenge, const CancelToken& token) const {
    auto params = parse_auth_challenge(challenge);
    if (params["scheme"] != "bearer" || params["realm"].empty()) {
        throw HttpError("Unsupported registry auth challenge: " + challenge, 401);
    }

    std::string url = params["realm"];
    std::string sep = url.find('?') == std::string::npos ? "?" : "&";
    if (!params["service"].empty()) {
        url += sep + "service=" + encode(params["service"]);
        sep = "&";
    }
    if (!params["scope"].empty()) url += sep + "scope=" + encode(params["scope"]);

    HttpRequest request;
    request.url = url;
    request.timeout = std::chrono::seconds(30);
    if (!user_.empty()) {
        request.basic_user = user_;
        request.basic_password = password_;
    }
    HttpResponse response = http_->perform(request, token);
    if (!response.ok()) {
        throw HttpError(std::format("Registry token request failed with HTTP {}", response.status), response.status);
    }

    QJsonObject obj = QJsonDocument::fromJson(QByteArray::fromStdString(response.body)).object();
    std::string bearer = obj["token"].toString().toStdString();
    if (bearer.empty()) bearer = obj["access_token"].toString().toStdString();
    if (bearer.empty()) throw HttpError("Registry token response carried no token");
    return bearer;
}

std::string RegistryClient::resolve_digest(const std::string& image, const CancelToken& token) const {
    ImageReference ref;
    try {
        ref = parse_image_reference(image);
    } catch (const std::invalid_argument& e) {
        throw HttpError(e.what());
    }

    HttpResponse response = head_manifest(ref, "", token);
    if (response.status == 401) {
        auto challenge = response.header("www-authenticate");
        if (!challenge) throw HttpError("Registry answered 401 without a challenge", 401);
        response = head_manifest(ref, fetch_token(*challenge, token), token);
    }
    if (!response.ok()) {
        throw HttpError(std::format("Manifest lookup for {} failed with HTTP {}", image, response.status),
                        response.status);
    }

    auto digest = response.header("docker-content-digest");
    if (!digest || digest->empty()) throw HttpError("Registry did not report a digest for " + image);
    log_verbose(std::format("Resolved {} to {}", image, *digest));
    return *digest;
}
