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

#ifndef REGISTRY_CLIENT_H
#define REGISTRY_CLIENT_H

#include "http_client.h"

#include <map>
#include <memory>
#include <string>

struct ImageReference {
    std::string registry;    // host[:port]
    std::string repository;
    std::string tag;         // tag or digest

    std::string manifest_url() const;
};

// Splits "host/repo/name:tag". References without a registry host resolve
// to Docker Hub, and a missing tag means "latest".
ImageReference parse_image_reference(const std::string& reference);

// Parses `Bearer realm="...",service="...",scope="..."`
std::map<std::string, std::string> parse_auth_challenge(const std::string& header);

class RegistryClient {
public:
    RegistryClient(std::string user, std::string password,
                   std::shared_ptr<HttpClient> http = std::make_shared<HttpClient>());
    virtual ~RegistryClient() = default;

    // Content digest of a pushed image; throws HttpError
    virtual std::string resolve_digest(const std::string& image, const CancelToken& token) const;

private:
    HttpResponse head_manifest(const ImageReference& ref, const std::string& bearer, const CancelToken& token) const;
    std::string fetch_token(const std::string& challenge, const CancelToken& token) const;

    std::string user_;
    std::string password_;
    std::shared_ptr<HttpClient> http_;
};

#endif // REGISTRY_CLIENT_H
