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

#include "cluster_client.h"

#include <gtest/gtest.h>

TEST(WatchEvent, CompleteConditionIsTerminal) {
    WatchEvent event = parse_watch_event(R"({"type":"MODIFIED","object":{"kind":"Job",
        "metadata":{"name":"build-1b4e28ba"},
        "status":{"conditions":[{"type":"Complete","status":"True"}],"succeeded":1}}})");
    EXPECT_EQ(event.type, "MODIFIED");
    EXPECT_EQ(event.job_name, "build-1b4e28ba");
    auto condition = event.terminal_condition();
    ASSERT_TRUE(condition.has_value());
    EXPECT_EQ(condition->type, "Complete");
}

TEST(WatchEvent, FailedConditionCarriesReason) {
    WatchEvent event = parse_watch_event(R"({"type":"MODIFIED","object":{"metadata":{"name":"build-1"},
        "status":{"conditions":[{"type":"Failed","status":"True","reason":"DeadlineExceeded",
        "message":"Job was active longer than specified deadline"}]}}})");
    auto condition = event.terminal_condition();
    ASSERT_TRUE(condition.has_value());
    EXPECT_EQ(condition->type, "Failed");
    EXPECT_EQ(condition->reason, "DeadlineExceeded");
    EXPECT_EQ(condition->message, "Job was active longer than specified deadline");
}

TEST(WatchEvent, RunningJobHasNoTerminalCondition) {
    WatchEvent added = parse_watch_event(R"({"type":"ADDED","object":{"metadata":{"name":"build-1"},"status":{}}})");
    EXPECT_FALSE(added.terminal_condition().has_value());

    WatchEvent suspended = parse_watch_event(R"({"type":"MODIFIED","object":{"metadata":{"name":"build-1"},
        "status":{"conditions":[{"type":"Failed","status":"False"},{"type":"Suspended","status":"True"}]}}})");
    EXPECT_FALSE(suspended.terminal_condition().has_value());
}

TEST(WatchEvent, ErrorEventReadsStatusMessage) {
    WatchEvent event = parse_watch_event(R"({"type":"ERROR","object":{"kind":"Status","status":"Failure",
        "message":"too old resource version: 123 (456)","reason":"Expired","code":410}})");
    EXPECT_EQ(event.type, "ERROR");
    EXPECT_EQ(event.error_message, "too old resource version: 123 (456)");

    WatchEvent bare = parse_watch_event(R"({"type":"ERROR","object":{"reason":"Gone"}})");
    EXPECT_EQ(bare.error_message, "Gone");
}

TEST(WatchEvent, MalformedLinesAreRejected) {
    EXPECT_THROW(parse_watch_event("{\"type\":"), ClusterError);
    EXPECT_THROW(parse_watch_event("[1,2,3]"), ClusterError);
    EXPECT_THROW(parse_watch_event(R"({"object":{}})"), ClusterError);
}
