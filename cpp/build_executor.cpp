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

#include "build_executor.h"

#include <algorithm>
#include <format>

#include <QJsonDocument>

namespace {

const char* docker_config_volume = "docker-config";

Volume registry_credentials(const std::string& secret) {
    Volume volume;
    volume.name = docker_config_volume;
    volume.secret_name = secret;
    volume.items = {{".dockerconfigjson", "config.json"}};
    return volume;
}

Volume scratch_volume() {
    Volume volume;
    volume.name = "tmp";
    return volume;
}

double elapsed_secs(std::chrono::steady_clock::time_point start) {
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    return std::max(elapsed.count(), 1e-6);
}

} // namespace

ExecutorOptions ExecutorOptions::from_config(const WorkerConfig& config) {
    ExecutorOptions options;
    options.registry = config.registry;
    options.ns = config.build_namespace;
    options.registry_secret = config.registry_secret;
    options.cache_repo = config.cache_repo();
    options.git_credentials_secret = config.kaniko_git_credentials;
    options.generate_sbom = config.generate_sbom;
    options.sign_images = config.sign_images;
    options.cosign_key = config.cosign_key;
    options.cosign_keyless = config.cosign_keyless;
    options.build_timeout = std::chrono::duration_cast<std::chrono::seconds>(config.build_timeout);
    return options;
}

ImageTags image_tags(const std::string& registry, const BuildJob& job) {
    std::string repository = job.service_name.empty()
        ? std::format("{}/{}/{}", registry, short_id(job.project_id), short_id(job.service_id))
        : std::format("{}/{}", registry, to_lower(job.service_name));
    return {repository + ":" + short_sha(job.git_sha), repository + ":latest"};
}

std::string git_context(const BuildJob& job) {
    std::string repo = remove_prefix(remove_prefix(job.git_repo, "https://"), "http://");
    std::string context = std::format("git://{}#refs/heads/{}#{}", repo, job.git_branch, job.git_sha);
    const std::string& sub = job.build_config.context;
    if (!sub.empty() && sub != ".") context += ":" + sub;
    return context;
}

std::vector<std::string> kaniko_args(const BuildJob& job, const ImageTags& tags, const std::string& cache_repo) {
    const std::string dockerfile = job.build_config.dockerfile.empty() ? "Dockerfile" : job.build_config.dockerfile;
    std::vector<std::string> args = {
        "--dockerfile=" + dockerfile,
        "--context=" + git_context(job),
        "--destination=" + tags.primary,
        "--destination=" + tags.latest,
        "--cache=true",
        "--cache-repo=" + cache_repo,
        "--cache-ttl=168h",
        "--reproducible",
        "--snapshot-mode=redo",
        "--label=org.opencontainers.image.source=" + job.git_repo,
        "--label=org.opencontainers.image.revision=" + job.git_sha,
        "--label=org.opencontainers.image.created=" + format_rfc3339(std::chrono::system_clock::now()),
        "--label=dev.buildyard.service-id=" + uuid_string(job.service_id),
        "--label=dev.buildyard.release-id=" + uuid_string(job.release_id),
        "--verbosity=info",
    };
    // build_args is ordered by key, so the argument list is stable
    for (const auto& [key, value] : job.build_config.build_args) {
        args.push_back(std::format("--build-arg={}={}", key, value));
    }
    if (!job.build_config.target.empty()) args.push_back("--target=" + job.build_config.target);
    return args;
}

BuildExecutor::BuildExecutor(ExecutorOptions options, std::shared_ptr<ClusterClient> cluster,
                             std::shared_ptr<RegistryClient> registry)
    : options_(std::move(options)), cluster_(std::move(cluster)), registry_(std::move(registry)) {
    if (options_.cache_repo.empty()) options_.cache_repo = options_.registry + "/cache";
}

bool BuildExecutor::signing_configured() const {
    return options_.sign_images && (!options_.cosign_key.empty() || options_.cosign_keyless);
}

ClusterJobSpec BuildExecutor::base_spec(const std::string& prefix, const std::string& app, const BuildJob& job) const {
    ClusterJobSpec spec;
    spec.name = std::format("{}-{}", prefix, short_id(job.id));
    spec.ns = options_.ns;
    spec.labels = {{label_build_id, uuid_string(job.id)}, {label_app_name, app}};
    return spec;
}

ClusterJobSpec BuildExecutor::build_job_spec(const BuildJob& job, const ImageTags& tags) const {
    ClusterJobSpec spec = base_spec("build", "kaniko-build", job);
    spec.pod_labels = spec.labels;
    spec.labels[label_service_id] = uuid_string(job.service_id);
    spec.annotations = {
        {"buildyard.dev/git-repo", job.git_repo},
        {"buildyard.dev/git-sha", job.git_sha},
        {"buildyard.dev/git-branch", job.git_branch},
    };

    spec.container_name = "kaniko";
    spec.image = kaniko_image;
    spec.args = kaniko_args(job, tags, options_.cache_repo);
    if (!options_.git_credentials_secret.empty()) {
        spec.env.push_back(EnvVar::from_secret("GIT_TOKEN", options_.git_credentials_secret, "token"));
    }
    spec.requests = {"500m", "1Gi"};
    spec.limits = {"2", "4Gi"};

    // Unpacking base image layers recreates root-owned files, so kaniko runs
    // as root inside its container, still without privilege escalation or capabilities
    spec.run_as_root = true;
    spec.read_only_root_fs = false;

    spec.volumes = {registry_credentials(options_.registry_secret)};
    spec.mounts = {{docker_config_volume, "/kaniko/.docker", true}};
    spec.avoid_node_label = "nvidia.com/gpu";
    spec.active_deadline_secs = options_.build_timeout.count();
    spec.ttl_after_finished_secs = 3600;
    return spec;
}

ClusterJobSpec BuildExecutor::sbom_job_spec(const BuildJob& job, const std::string& image) const {
    ClusterJobSpec spec = base_spec("sbom", "syft-sbom", job);
    spec.container_name = "syft";
    spec.image = syft_image;
    spec.args = {"scan", "--quiet", "--output", sbom_format, "registry:" + image};
    spec.env = {EnvVar::literal("DOCKER_CONFIG", "/home/syft/.docker")};
    spec.requests = {"100m", "256Mi"};
    spec.limits = {"500m", "1Gi"};
    spec.run_as_user = 1000;
    spec.read_only_root_fs = true;
    spec.volumes = {registry_credentials(options_.registry_secret), scratch_volume()};
    spec.mounts = {{docker_config_volume, "/home/syft/.docker", true}, {"tmp", "/tmp", false}};
    spec.active_deadline_secs = 300;
    spec.ttl_after_finished_secs = 1800;
    return spec;
}

ClusterJobSpec BuildExecutor::sign_job_spec(const BuildJob& job, const std::string& image) const {
    ClusterJobSpec spec = base_spec("sign", "cosign-sign", job);
    spec.container_name = "cosign";
    spec.image = cosign_image;
    spec.env = {EnvVar::literal("DOCKER_CONFIG", "/home/nonroot/.docker")};
    spec.volumes = {registry_credentials(options_.registry_secret), scratch_volume()};
    spec.mounts = {{docker_config_volume, "/home/nonroot/.docker", true}, {"tmp", "/tmp", false}};

    if (!options_.cosign_key.empty()) {
        spec.args = {"sign", "--key", "/cosign/cosign.key", "--yes", image};
        Volume key;
        key.name = "cosign-key";
        key.secret_name = options_.cosign_key;
        spec.volumes.push_back(key);
        spec.mounts.push_back({"cosign-key", "/cosign", true});
        spec.env.push_back(EnvVar::from_secret("COSIGN_PASSWORD", options_.cosign_key, "password"));
    } else {
        // Keyless: short-lived certificate from the identity provider, logged to the transparency log
        spec.args = {"sign", "--yes", image};
        spec.env.push_back(EnvVar::literal("COSIGN_EXPERIMENTAL", "1"));
    }

    spec.requests = {"50m", "128Mi"};
    spec.limits = {"200m", "512Mi"};
    spec.run_as_user = 1000;
    spec.read_only_root_fs = true;
    spec.active_deadline_secs = 180;
    spec.ttl_after_finished_secs = 1800;
    return spec;
}

void BuildExecutor::run_stage(const ClusterJobSpec& spec, const CancelToken& token, Log& log) {
    token.check();
    try {
        cluster_->create_job(spec, token);
    } catch (const CancelledError&) {
        throw;
    } catch (const std::exception& e) {
        throw ClusterError(std::format("failed to create job {}: {}", spec.name, e.what()));
    }
    log.append(std::format("Created cluster job {}", spec.name));
    wait_for_completion(spec, token);
}

void BuildExecutor::wait_for_completion(const ClusterJobSpec& spec, const CancelToken& token) {
    bool terminal = false;
    bool succeeded = false;
    std::string failure;

    try {
        cluster_->watch_job(spec.ns, spec.name, token, [&](const WatchEvent& event) {
            if (event.type == "ERROR") {
                terminal = true;
                failure = "watch error: " + event.error_message;
                return false;
            }
            if (event.type == "DELETED") {
                terminal = true;
                failure = "job was deleted before it finished";
                return false;
            }
            auto condition = event.terminal_condition();
            if (!condition) return true;
            terminal = true;
            succeeded = condition->type == "Complete";
            if (!succeeded) {
                failure = condition->message.empty() ? condition->reason
                                                     : std::format("{}: {}", condition->reason, condition->message);
            }
            return false;
        });
    } catch (const CancelledError&) {
        throw;
    } catch (const std::exception& e) {
        throw StageError(std::format("watching job {} failed: {}", spec.name, e.what()));
    }

    if (!terminal) {
        token.check();
        throw StageError(std::format("watch stream for job {} closed before the job finished", spec.name));
    }
    if (!succeeded) throw StageError(std::format("job {} failed: {}", spec.name, failure));
}

void BuildExecutor::forward_logs(const ClusterJobSpec& spec, const CancelToken& token, Log& log) {
    if (token.done()) return;
    try {
        const std::string pod = cluster_->find_job_pod(spec.ns, spec.name, token);
        cluster_->stream_pod_logs(spec.ns, pod, spec.container_name, token, [&](const std::string& line) {
            log.append(line);
            return true;
        });
    } catch (const std::exception& e) {
        log_warning(std::format("Could not retrieve logs of job {}: {}", spec.name, e.what()));
        log.append(std::format("Logs of {} are unavailable: {}", spec.name, e.what()));
    }
}

std::string BuildExecutor::collect_output(const ClusterJobSpec& spec, const CancelToken& token, Log& log) {
    std::string output;
    try {
        const std::string pod = cluster_->find_job_pod(spec.ns, spec.name, token);
        cluster_->stream_pod_logs(spec.ns, pod, spec.container_name, token, [&](const std::string& line) {
            output += line;
            output += '\n';
            return true;
        });
    } catch (const std::exception& e) {
        log_warning(std::format("Could not retrieve output of job {}: {}", spec.name, e.what()));
        log.append(std::format("Output of {} is unavailable: {}", spec.name, e.what()));
        return "";
    }
    return output;
}

void BuildExecutor::generate_sbom(const BuildJob& job, const std::string& image, BuildResult& result,
                                  const CancelToken& token, Log& log) {
    log.append("Generating SBOM");
    const ClusterJobSpec spec = sbom_job_spec(job, image);
    try {
        run_stage(spec, token, log);
    } catch (const CancelledError&) {
        throw;
    } catch (const std::exception& e) {
        log_warning(std::format("SBOM generation for {} failed: {}", short_id(job.id), e.what()));
        log.append(std::format("SBOM generation failed: {}", e.what()));
        return;
    }

    std::string output = collect_output(spec, token, log);
    if (!QJsonDocument::fromJson(QByteArray::fromStdString(output)).isObject()) {
        log_warning(std::format("SBOM job {} did not produce a valid {} document", spec.name, sbom_format));
        log.append("SBOM generation produced no usable output");
        return;
    }
    result.sbom = std::move(output);
    result.sbom_format = sbom_format;
    log.append(std::format("SBOM generated ({})", sbom_format));
}

void BuildExecutor::sign_image(const BuildJob& job, const std::string& image, BuildResult& result,
                               const CancelToken& token, Log& log) {
    log.append(std::format("Signing image ({})", options_.cosign_key.empty() ? "keyless" : "key"));
    const ClusterJobSpec spec = sign_job_spec(job, image);
    try {
        run_stage(spec, token, log);
    } catch (const CancelledError&) {
        throw;
    } catch (const std::exception& e) {
        log_warning(std::format("Signing {} failed: {}", image, e.what()));
        log.append(std::format("Image signing failed: {}", e.what()));
        return;
    }
    forward_logs(spec, token, log);

    // cosign stores the signature next to the image under the .sig tag
    result.image_signature = image + ".sig";
    log.append("Image signed");
}

BuildResult BuildExecutor::execute(const BuildJob& job, const CancelToken& token, Log& log) {
    const auto start = std::chrono::steady_clock::now();
    BuildResult result;
    result.job_id = job.id;
    result.release_id = job.release_id;

    const ImageTags tags = image_tags(options_.registry, job);
    result.image_uri = tags.primary;
    log.append(std::format("Starting build of {} @ {}", job.git_repo, short_sha(job.git_sha)));

    const ClusterJobSpec build_spec = build_job_spec(job, tags);
    try {
        job.validate();
        run_stage(build_spec, token, log);
    } catch (const DeadlineExceededError& e) {
        result.error_message = std::format("build deadline exceeded: {}", e.what());
    } catch (const CancelledError& e) {
        result.error_message = std::format("build cancelled: {}", e.what());
    } catch (const StageError& e) {
        forward_logs(build_spec, token, log);
        result.error_message = std::format("build failed: {}", e.what());
    } catch (const std::exception& e) {
        result.error_message = std::format("build failed: {}", e.what());
    }

    if (!result.error_message.empty()) {
        log.append(result.error_message);
        log_error(std::format("Build {} failed: {}", short_id(job.id), result.error_message));
        result.duration_secs = elapsed_secs(start);
        return result;
    }

    log.append("Image build completed");
    forward_logs(build_spec, token, log);

    try {
        if (registry_) {
            try {
                result.image_digest = registry_->resolve_digest(tags.primary, token.with_timeout(std::chrono::seconds(30)));
                log.append("Image digest: " + result.image_digest);
            } catch (const std::exception& e) {
                token.check();
                log_warning(std::format("Could not resolve digest of {}: {}", tags.primary, e.what()));
            }
        }

        if (options_.generate_sbom) generate_sbom(job, tags.primary, result, token, log);

        if (signing_configured()) {
            sign_image(job, tags.primary, result, token, log);
        } else if (options_.sign_images) {
            log.append("Image signing skipped: no signing key or keyless identity configured");
        }
    } catch (const CancelledError& e) {
        log_warning(std::format("Post-build stages of {} interrupted: {}", short_id(job.id), e.what()));
        log.append(std::format("Post-build stages interrupted: {}", e.what()));
    }

    result.success = true;
    result.duration_secs = elapsed_secs(start);
    log.append(std::format("Build completed in {:.1f}s", result.duration_secs));
    log_info(std::format("Build {} produced {}", short_id(job.id), result.image_uri));
    return result;
}
