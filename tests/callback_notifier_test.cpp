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
#include "fakes.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>

#include <QJsonDocument>

namespace {

BuildResult pushed_result() {
    BuildJob job = sample_job();
    BuildResult result;
    result.job_id = job.id;
    result.release_id = job.release_id;
    result.success = true;
    result.image_uri = "registry.example.com/api:abc123de";
    result.image_digest = "sha256:4f6a1c9d7e2b8a3f5c0e1d9b7a6f4e3d2c1b0a9f8e7d6c5b4a3f2e1d0c9b8a7f";
    result.duration_secs = 42.5;
    return result;
}

bool has_header(const HttpRequest& request, const std::string& header) {
    return std::find(request.headers.begin(), request.headers.end(), header) != request.headers.end();
}

} // namespace

TEST(CallbackNotifier, PostsTheResultAsJson) {
    auto http = std::make_shared<FakeHttp>();
    http->push(200);
    CallbackNotifier notifier("cb-key", std::chrono::seconds(7), http);

    const BuildResult result = pushed_result();
    notifier.notify("https://deploy.example.com/hooks/build", result, CancelToken());

    auto requests = http->requests();
    ASSERT_EQ(requests.size(), 1u);
    const HttpRequest& request = requests.front();
    EXPECT_EQ(request.method, "POST");
    EXPECT_EQ(request.url, "https://deploy.example.com/hooks/build");
    EXPECT_TRUE(has_header(request, "Content-Type: application/json"));
    EXPECT_EQ(request.bearer_token, "cb-key");
    ASSERT_TRUE(request.timeout.has_value());
    EXPECT_EQ(*request.timeout, std::chrono::seconds(7));

    QJsonDocument body = QJsonDocument::fromJson(QByteArray::fromStdString(request.body));
    ASSERT_TRUE(body.isObject());
    BuildResult sent = BuildResult::from_json(body.object());
    EXPECT_EQ(sent.job_id, result.job_id);
    EXPECT_EQ(sent.release_id, result.release_id);
    EXPECT_TRUE(sent.success);
    EXPECT_EQ(sent.image_uri, result.image_uri);
    EXPECT_EQ(sent.image_digest, result.image_digest);
    EXPECT_DOUBLE_EQ(sent.duration_secs, 42.5);
}

TEST(CallbackNotifier, OmitsAuthorizationWithoutAKey) {
    auto http = std::make_shared<FakeHttp>();
    http->push(204);
    CallbackNotifier notifier("", std::chrono::seconds(5), http);

    notifier.notify("http://hooks.internal/build", pushed_result(), CancelToken());

    auto requests = http->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_TRUE(requests.front().bearer_token.empty());
    EXPECT_FALSE(std::any_of(requests.front().headers.begin(), requests.front().headers.end(),
                             [](const std::string& h) { return h.starts_with("Authorization"); }));
}

TEST(CallbackNotifier, NonSuccessAnswerThrowsWithStatus) {
    auto http = std::make_shared<FakeHttp>();
    http->push(500, "boom");
    CallbackNotifier notifier("cb-key", std::chrono::seconds(5), http);

    try {
        notifier.notify("https://deploy.example.com/hooks/build", pushed_result(), CancelToken());
        FAIL() << "expected HttpError";
    } catch (const HttpError& e) {
        EXPECT_EQ(e.status(), 500);
        EXPECT_NE(std::string(e.what()).find("HTTP 500"), std::string::npos);
    }
}
