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

#ifndef CLUSTER_CLIENT_H
#define CLUSTER_CLIENT_H

#include "cancel_token.h"
#include "cluster_job.h"

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

class ClusterError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct JobCondition {
    std::string type;
    std::string status;
    std::string reason;
    std::string message;
};

// One event of a Job watch stream
struct WatchEvent {
    std::string type;  // ADDED, MODIFIED, DELETED, ERROR, BOOKMARK
    std::string job_name;
    std::vector<JobCondition> conditions;
    std::string error_message;

    // The first Complete or Failed condition with status True
    std::optional<JobCondition> terminal_condition() const;
};

// Decodes one newline-delimited JSON watch event. Throws ClusterError on malformed input.
WatchEvent parse_watch_event(const std::string& line);

// The slice of the cluster API the executor needs. Implementations must be
// safe for concurrent use by every in-flight build.
class ClusterClient {
public:
    using EventHandler = std::function<bool(const WatchEvent& event)>;  // false stops the watch
    using LineHandler = std::function<bool(const std::string& line)>;

    virtual ~ClusterClient() = default;

    virtual void create_job(const ClusterJobSpec& spec, const CancelToken& token) = 0;

    // Blocks delivering events until the handler returns false or the stream ends
    virtual void watch_job(const std::string& ns, const std::string& name, const CancelToken& token,
                           const EventHandler& on_event) = 0;

    // Name of the pod created for `job_name`; throws ClusterError if there is none
    virtual std::string find_job_pod(const std::string& ns, const std::string& job_name,
                                     const CancelToken& token) = 0;

    virtual void stream_pod_logs(const std::string& ns, const std::string& pod, const std::string& container,
                                 const CancelToken& token, const LineHandler& on_line) = 0;
};

#endif // CLUSTER_CLIENT_H
