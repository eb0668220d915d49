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

#ifndef BUILD_EXECUTOR_H
#define BUILD_EXECUTOR_H

#include "build_types.h"
#include "cancel_token.h"
#include "cluster_client.h"
#include "config.h"
#include "registry_client.h"
#include "utilities.h"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

inline constexpr const char* kaniko_image = "gcr.io/kaniko-project/executor:v1.19.0";
inline constexpr const char* syft_image = "anchore/syft:v1.4.1";
inline constexpr const char* cosign_image = "gcr.io/projectsigstore/cosign:v2.2.3";

inline constexpr const char* label_build_id = "buildyard.dev/build-id";
inline constexpr const char* label_service_id = "buildyard.dev/service-id";
inline constexpr const char* label_app_name = "app.kubernetes.io/name";

inline constexpr const char* sbom_format = "spdx-json";

// A cluster job that ran but did not succeed
class StageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Turns one job into its terminal result. Never throws for build failures;
// those are reported through BuildResult.
class Builder {
public:
    virtual ~Builder() = default;
    virtual BuildResult execute(const BuildJob& job, const CancelToken& token, Log& log) = 0;
};

struct ExecutorOptions {
    std::string registry = "ghcr.io";
    std::string ns = "buildyard-builds";
    std::string registry_secret = "regcred";
    std::string cache_repo;
    std::string git_credentials_secret;
    bool generate_sbom = true;
    bool sign_images = true;
    std::string cosign_key;
    bool cosign_keyless = false;
    std::chrono::seconds build_timeout{std::chrono::minutes(30)};

    static ExecutorOptions from_config(const WorkerConfig& config);
};

struct ImageTags {
    std::string primary;  // content-addressed, from the short commit SHA
    std::string latest;
};

ImageTags image_tags(const std::string& registry, const BuildJob& job);

// git://<repo>#refs/heads/<branch>#<sha>[:<context>]
std::string git_context(const BuildJob& job);

std::vector<std::string> kaniko_args(const BuildJob& job, const ImageTags& tags, const std::string& cache_repo);

class BuildExecutor : public Builder {
public:
    BuildExecutor(ExecutorOptions options, std::shared_ptr<ClusterClient> cluster,
                  std::shared_ptr<RegistryClient> registry);

    BuildResult execute(const BuildJob& job, const CancelToken& token, Log& log) override;

    ClusterJobSpec build_job_spec(const BuildJob& job, const ImageTags& tags) const;
    ClusterJobSpec sbom_job_spec(const BuildJob& job, const std::string& image) const;
    ClusterJobSpec sign_job_spec(const BuildJob& job, const std::string& image) const;

    // Signing is on and has either a key or keyless identity to sign with
    bool signing_configured() const;

    const ExecutorOptions& options() const { return options_; }

private:
    // Submits the job and waits for its terminal condition. Throws
    // StageError on failure, CancelledError when the token fires.
    void run_stage(const ClusterJobSpec& spec, const CancelToken& token, Log& log);
    void wait_for_completion(const ClusterJobSpec& spec, const CancelToken& token);

    // Best-effort; failures are logged, never thrown
    void forward_logs(const ClusterJobSpec& spec, const CancelToken& token, Log& log);
    std::string collect_output(const ClusterJobSpec& spec, const CancelToken& token, Log& log);

    void generate_sbom(const BuildJob& job, const std::string& image, BuildResult& result,
                       const CancelToken& token, Log& log);
    void sign_image(const BuildJob& job, const std::string& image, BuildResult& result,
                    const CancelToken& token, Log& log);

    ClusterJobSpec base_spec(const std::string& prefix, const std::string& app, const BuildJob& job) const;

    ExecutorOptions options_;
    std::shared_ptr<ClusterClient> cluster_;
    std::shared_ptr<RegistryClient> registry_;
};

#endif // BUILD_EXECUTOR_H
