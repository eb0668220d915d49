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
#include "build_types.h"
#include "fakes.h"
#include "utilities.h"

#include <gtest/gtest.h>

#include <format>

#include <QJsonDocument>

TEST(BuildTypes, StatusNamesAreStable) {
    EXPECT_EQ(job_status_to_string(JobStatus::Building), "building");
    EXPECT_EQ(job_status_from_string("cancelled"), JobStatus::Cancelled);
    EXPECT_THROW(job_status_from_string("paused"), std::invalid_argument);
}

TEST(BuildTypes, OnlyFinishedStatusesAreTerminal) {
    EXPECT_FALSE(is_terminal(JobStatus::Queued));
    EXPECT_FALSE(is_terminal(JobStatus::Building));
    EXPECT_TRUE(is_terminal(JobStatus::Completed));
    EXPECT_TRUE(is_terminal(JobStatus::Failed));
    EXPECT_TRUE(is_terminal(JobStatus::Cancelled));
}

TEST(BuildTypes, ValidateRequiresRepositoryAndSha) {
    BuildJob job = sample_job();
    EXPECT_NO_THROW(job.validate());

    job.git_sha.clear();
    EXPECT_THROW(job.validate(), std::invalid_argument);

    job = sample_job();
    job.git_repo.clear();
    EXPECT_THROW(job.validate(), std::invalid_argument);
}

TEST(BuildTypes, ShortFormsTruncateToEightCharacters) {
    EXPECT_EQ(short_sha("abc123def456"), "abc123de");
    EXPECT_EQ(short_sha("abc"), "abc");

    QUuid id = QUuid::fromString(QStringLiteral("{1b4e28ba-2fa1-11d2-883f-0016d3cca427}"));
    EXPECT_EQ(short_id(id), "1b4e28ba");
    EXPECT_EQ(uuid_string(id), "1b4e28ba-2fa1-11d2-883f-0016d3cca427");
}

TEST(BuildTypes, ResultJsonOmitsEmptyErrorMessage) {
    BuildResult result;
    result.job_id = QUuid::createUuid();
    result.success = true;
    result.image_uri = "ghcr.io/api:abc123de";
    result.duration_secs = 12.5;

    QJsonObject obj = QJsonDocument::fromJson(QByteArray::fromStdString(result.to_json_string())).object();
    EXPECT_FALSE(obj.contains("error_message"));
    EXPECT_TRUE(obj["success"].toBool());
    EXPECT_EQ(obj["image_uri"].toString(), "ghcr.io/api:abc123de");
    EXPECT_DOUBLE_EQ(obj["duration_secs"].toDouble(), 12.5);

    result.success = false;
    result.error_message = "build failed: job build-1 failed";
    obj = result.to_json();
    EXPECT_EQ(obj["error_message"].toString(), "build failed: job build-1 failed");
}

TEST(BuildTypes, JobJsonKeepsBuildConfig) {
    BuildJob job = sample_job();
    job.build_config.dockerfile = "docker/Dockerfile.prod";
    job.build_config.context = "services/api";
    job.build_config.build_args = {{"VERSION", "1.2.3"}, {"COMMIT", "abc"}};
    job.priority = 7;

    BuildJob decoded = BuildJob::from_json(job.to_json());
    EXPECT_EQ(decoded.id, job.id);
    EXPECT_EQ(decoded.build_config.dockerfile, "docker/Dockerfile.prod");
    EXPECT_EQ(decoded.build_config.context, "services/api");
    EXPECT_EQ(decoded.build_config.build_args, job.build_config.build_args);
    EXPECT_EQ(decoded.priority, 7);
}

TEST(BuildTypes, MissingBuildConfigFallsBackToDefaults) {
    QJsonObject obj;
    obj["git_repo"] = "https://github.com/example/api";
    obj["git_sha"] = "abc123def456";
    BuildJob job = BuildJob::from_json(obj);
    EXPECT_EQ(job.build_config.type, "dockerfile");
    EXPECT_EQ(job.build_config.dockerfile, "Dockerfile");
    EXPECT_EQ(job.build_config.context, ".");
}

TEST(ImageTags, SameInputsGiveIdenticalTags) {
    BuildJob job = sample_job("abc123def456");
    BuildJob again = sample_job("abc123def456");
    again.service_name = job.service_name;

    ImageTags first = image_tags("ghcr.io/acme", job);
    ImageTags second = image_tags("ghcr.io/acme", again);
    EXPECT_EQ(first.primary, "ghcr.io/acme/api:abc123de");
    EXPECT_EQ(first.latest, "ghcr.io/acme/api:latest");
    EXPECT_EQ(first.primary, second.primary);
    EXPECT_EQ(first.latest, second.latest);
}

TEST(ImageTags, ServiceNameIsLowerCased) {
    BuildJob job = sample_job();
    job.service_name = "Billing-API";
    EXPECT_EQ(image_tags("registry.local", job).primary, "registry.local/billing-api:abc123de");
}

TEST(ImageTags, FallsBackToIdsWithoutServiceName) {
    BuildJob job = sample_job();
    job.service_name.clear();
    ImageTags tags = image_tags("ghcr.io", job);
    EXPECT_EQ(tags.primary, std::format("ghcr.io/{}/{}:abc123de", short_id(job.project_id), short_id(job.service_id)));
}

TEST(Log, StampsLinesAndForwardsThemToTheSink) {
    std::vector<std::string> forwarded;
    Log log([&](const std::string& line) { forwarded.push_back(line); });
    log.append("Step 1/4 : FROM alpine\n");
    log.append("");
    log.append("Step 2/4 : RUN apk add curl");

    ASSERT_EQ(forwarded.size(), 2u);
    EXPECT_EQ(forwarded[0], "Step 1/4 : FROM alpine");
    std::string text = log.get();
    EXPECT_NE(text.find("] Step 2/4 : RUN apk add curl\n"), std::string::npos);
    EXPECT_EQ(text.front(), '[');
}
