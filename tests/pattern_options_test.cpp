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

#include "pattern_options.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace regexkit::api;
using json = nlohmann::json;

class PatternOptionsTest : public ::testing::Test {};

// Empty JSON, all defaults
TEST_F(PatternOptionsTest, DefaultConfiguration) {
    PatternOptions opts = PatternOptions::fromJson("{}");

    EXPECT_TRUE(opts.case_sensitive);
    EXPECT_TRUE(opts.utf8);
    EXPECT_FALSE(opts.posix_syntax);
    EXPECT_FALSE(opts.longest_match);
    EXPECT_FALSE(opts.log_errors);
    EXPECT_FALSE(opts.literal);
    EXPECT_FALSE(opts.never_nl);
    EXPECT_FALSE(opts.dot_nl);
    EXPECT_FALSE(opts.never_capture);
    EXPECT_FALSE(opts.perl_classes);
    EXPECT_FALSE(opts.word_boundary);
    EXPECT_FALSE(opts.one_line);
    EXPECT_EQ(opts.max_mem, 8388608);

    EXPECT_EQ(opts, PatternOptions::defaults());
}

// Empty string is the same as defaults
TEST_F(PatternOptionsTest, EmptyStringIsDefaults) {
    EXPECT_EQ(PatternOptions::fromJson(""), PatternOptions::defaults());
}

TEST_F(PatternOptionsTest, CustomConfiguration) {
    json j;
    j["case_sensitive"] = false;
    j["encoding"] = "Latin1";
    j["longest_match"] = true;
    j["dot_nl"] = true;
    j["never_capture"] = true;
    j["max_mem"] = 1048576;

    PatternOptions opts = PatternOptions::fromJson(j.dump());

    EXPECT_FALSE(opts.case_sensitive);
    EXPECT_FALSE(opts.utf8);
    EXPECT_TRUE(opts.longest_match);
    EXPECT_TRUE(opts.dot_nl);
    EXPECT_TRUE(opts.never_capture);
    EXPECT_EQ(opts.max_mem, 1048576);

    // Untouched fields keep their defaults
    EXPECT_FALSE(opts.posix_syntax);
    EXPECT_FALSE(opts.literal);
}

TEST_F(PatternOptionsTest, UnknownFieldsIgnored) {
    PatternOptions opts = PatternOptions::fromJson(R"({"no_such_option": 42})");
    EXPECT_EQ(opts, PatternOptions::defaults());
}

TEST_F(PatternOptionsTest, InvalidJson) {
    EXPECT_THROW(PatternOptions::fromJson("{not json"), std::runtime_error);
}

TEST_F(PatternOptionsTest, WrongFieldType) {
    EXPECT_THROW(PatternOptions::fromJson(R"({"case_sensitive": "yes"})"), std::runtime_error);
    EXPECT_THROW(PatternOptions::fromJson(R"({"max_mem": "big"})"), std::runtime_error);
}

TEST_F(PatternOptionsTest, UnknownEncoding) {
    EXPECT_THROW(PatternOptions::fromJson(R"({"encoding": "UTF16"})"), std::runtime_error);
}

TEST_F(PatternOptionsTest, NonPositiveMaxMem) {
    EXPECT_THROW(PatternOptions::fromJson(R"({"max_mem": 0})"), std::runtime_error);
}

TEST_F(PatternOptionsTest, ToRE2Options) {
    PatternOptions opts;
    opts.case_sensitive = false;
    opts.utf8 = false;
    opts.posix_syntax = true;
    opts.word_boundary = true;
    opts.max_mem = 1 << 20;

    RE2::Options re2_opts = opts.toRE2Options();

    EXPECT_FALSE(re2_opts.case_sensitive());
    EXPECT_EQ(re2_opts.encoding(), RE2::Options::EncodingLatin1);
    EXPECT_TRUE(re2_opts.posix_syntax());
    EXPECT_TRUE(re2_opts.word_boundary());
    EXPECT_FALSE(re2_opts.log_errors());
    EXPECT_EQ(re2_opts.max_mem(), 1 << 20);
}

// RE2::Options -> PatternOptions -> RE2::Options keeps every field
TEST_F(PatternOptionsTest, FromRE2Options) {
    RE2::Options re2_opts;
    re2_opts.set_case_sensitive(false);
    re2_opts.set_never_nl(true);
    re2_opts.set_one_line(true);
    re2_opts.set_encoding(RE2::Options::EncodingLatin1);

    PatternOptions opts = PatternOptions::fromRE2Options(re2_opts);

    EXPECT_FALSE(opts.case_sensitive);
    EXPECT_TRUE(opts.never_nl);
    EXPECT_TRUE(opts.one_line);
    EXPECT_FALSE(opts.utf8);
    EXPECT_EQ(opts.max_mem, re2_opts.max_mem());
}

TEST_F(PatternOptionsTest, JsonRoundTrip) {
    PatternOptions opts = PatternOptions::fromCaseSensitive(false);
    opts.literal = true;
    opts.utf8 = false;

    json j = json::parse(opts.toJson());
    EXPECT_EQ(j["encoding"], "Latin1");
    EXPECT_EQ(j["case_sensitive"], false);

    EXPECT_EQ(PatternOptions::fromJson(opts.toJson()), opts);
}

TEST_F(PatternOptionsTest, FromCaseSensitive) {
    EXPECT_TRUE(PatternOptions::fromCaseSensitive(true).case_sensitive);
    EXPECT_FALSE(PatternOptions::fromCaseSensitive(false).case_sensitive);
}
