/*
 * Copyright 2025 AxonOps
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "match.h"
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>

using namespace regexkit;
using namespace regexkit::api;

namespace {

engine::RawMatch makeRaw(std::initializer_list<engine::RawSpan> spans) {
    engine::RawMatch raw;
    raw.groups.assign(spans);
    return raw;
}

Match buildMatch(const std::string& subject, const engine::RawMatch& raw,
                 std::shared_ptr<const GroupNames> names = nullptr) {
    auto owned = std::make_shared<const std::string>(subject);
    text::PositionMapper mapper(*owned, text::Encoding::kUTF8);
    return Match(owned, raw, mapper, std::move(names));
}

}  // namespace

class MatchTest : public ::testing::Test {};

// "(a)(b)" against "ab"
TEST_F(MatchTest, CaptureGroupOrder) {
    Match m = buildMatch("ab", makeRaw({{0, 2}, {0, 1}, {1, 1}}));

    EXPECT_EQ(m.rangeCount(), 3u);
    EXPECT_EQ(m.substring(0), "ab");
    EXPECT_EQ(m.substring(1), "a");
    EXPECT_EQ(m.substring(2), "b");
    EXPECT_EQ(m[1], "a");
}

TEST_F(MatchTest, IndexOutOfRange) {
    Match m = buildMatch("ab", makeRaw({{0, 2}}));

    EXPECT_EQ(m.rangeCount(), 1u);
    EXPECT_THROW(m.substring(1), std::out_of_range);
    EXPECT_THROW(m[5], std::out_of_range);
    EXPECT_THROW(m.matched(1), std::out_of_range);
    EXPECT_THROW(m.range(1), std::out_of_range);
}

TEST_F(MatchTest, UnmatchedGroupIsAbsent) {
    Match m = buildMatch("b", makeRaw({{0, 1}, {engine::kNotFound, 0}, {0, 1}}));

    EXPECT_EQ(m.rangeCount(), 3u);
    EXPECT_TRUE(m.matched(0));
    EXPECT_FALSE(m.matched(1));
    EXPECT_FALSE(m.range(1).has_value());
    EXPECT_EQ(m.substring(1), "");
    EXPECT_EQ(m.substring(2), "b");
}

TEST_F(MatchTest, ZeroWidthMatch) {
    Match m = buildMatch("abc", makeRaw({{1, 0}}));

    EXPECT_TRUE(m.wholeRange().empty());
    EXPECT_EQ(m.start(), m.end());
    EXPECT_EQ(m.start().offset, 1u);
    EXPECT_EQ(m.substring(0), "");
}

TEST_F(MatchTest, NamedGroups) {
    auto names = std::make_shared<const GroupNames>(GroupNames{{"user", 1}, {"host", 2}});
    Match m = buildMatch("bob@example", makeRaw({{0, 11}, {0, 3}, {4, 7}}), names);

    EXPECT_EQ(m.substring("user"), "bob");
    EXPECT_EQ(m.substring("host"), "example");
    EXPECT_THROW(m.substring("port"), std::out_of_range);
}

TEST_F(MatchTest, NoNameTable) {
    Match m = buildMatch("ab", makeRaw({{0, 2}}));
    EXPECT_THROW(m.substring("any"), std::out_of_range);
}

// Positions count code points and clusters, slicing stays byte exact
TEST_F(MatchTest, PositionsInUnicodeSubject) {
    const std::string subject = "na\xC3\xAFve caf\xC3\xA9";  // "naïve café"
    Match m = buildMatch(subject, makeRaw({{7, 5}}));       // "café"

    EXPECT_EQ(m.substring(0), "caf\xC3\xA9");
    EXPECT_EQ(m.start().code_point, 6u);
    EXPECT_EQ(m.start().grapheme, 6u);
    EXPECT_EQ(m.end().code_point, 10u);
    EXPECT_EQ(m.end().grapheme, 10u);
    EXPECT_EQ(m.wholeRange().length(), 5u);
}

// A group inside the match that starts before the previous group ends
TEST_F(MatchTest, NestedGroupsRewindWithinMatch) {
    const std::string subject = "\xC3\xA9\xC3\xA9 abcd";
    // whole "abcd" [5,9), group 1 "abcd", group 2 "bc" [6,8)
    Match m = buildMatch(subject, makeRaw({{5, 4}, {5, 4}, {6, 2}}));

    EXPECT_EQ(m.substring(1), "abcd");
    EXPECT_EQ(m.substring(2), "bc");
    ASSERT_TRUE(m.range(2).has_value());
    EXPECT_EQ(m.range(2)->start.code_point, 4u);
}

// Results stay valid once the caller's string is gone
TEST_F(MatchTest, OwnsSubject) {
    std::optional<Match> m;
    {
        std::string temp = "temporary";
        m.emplace(buildMatch(temp, makeRaw({{0, 4}})));
    }
    EXPECT_EQ(m->substring(0), "temp");
    EXPECT_EQ(m->subject(), "temporary");
}

class MatchDeathTest : public ::testing::Test {};

TEST_F(MatchDeathTest, OverallMatchNotFound) {
    EXPECT_DEATH(buildMatch("abc", makeRaw({{engine::kNotFound, 0}})),
                 "no overall match range");
}

TEST_F(MatchDeathTest, NoGroups) {
    EXPECT_DEATH(buildMatch("abc", engine::RawMatch{}), "no overall match range");
}

TEST_F(MatchDeathTest, GroupPastEnd) {
    EXPECT_DEATH(buildMatch("abc", makeRaw({{1, 2}, {2, 9}})), "past the end");
}
