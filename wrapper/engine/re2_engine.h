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

#pragma once

#include <re2/re2.h>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace regexkit {
namespace engine {

/**
 * Offset sentinel for a group that did not take part in the match.
 */
constexpr size_t kNotFound = static_cast<size_t>(-1);

/**
 * One group of an engine result, in bytes from the start of the subject.
 */
struct RawSpan {
    size_t offset = kNotFound;
    size_t length = 0;

    bool found() const { return offset != kNotFound; }
};

/**
 * Engine result for one match: groups[0] is the whole match, groups[1..N]
 * the capture groups. Always NumberOfCapturingGroups() + 1 entries.
 */
struct RawMatch {
    std::vector<RawSpan> groups;
};

/**
 * Compilation failure reported by RE2.
 */
struct CompileError {
    int code = RE2::NoError;   // RE2::ErrorCode
    std::string message;       // RE2::error()
    std::string fragment;      // RE2::error_arg(), offending part of the pattern
};

/**
 * Compile a pattern.
 *
 * @param pattern regex pattern string
 * @param options RE2 options (log_errors is honoured as given)
 * @param error_out filled on failure, untouched on success
 * @return compiled pattern, or nullptr on error
 */
std::shared_ptr<const RE2> compile(
    const std::string& pattern,
    const RE2::Options& options,
    CompileError& error_out);

/**
 * First match in subject.
 *
 * @param re compiled pattern
 * @param subject text to search
 * @param anchor RE2::UNANCHORED or RE2::ANCHOR_START (ANCHOR_BOTH passes through)
 * @return raw match, or std::nullopt if nothing matched
 */
std::optional<RawMatch> firstMatch(
    const RE2& re,
    std::string_view subject,
    RE2::Anchor anchor);

/**
 * All non-overlapping matches, left to right.
 *
 * An empty match is allowed directly after a non-empty one; after an empty
 * match the search resumes one character further (one byte for Latin-1
 * patterns, one UTF-8 sequence otherwise, one byte inside ill-formed UTF-8).
 *
 * @param re compiled pattern
 * @param subject text to search
 * @return matches in ascending offset order (empty if none)
 */
std::vector<RawMatch> findAllMatches(
    const RE2& re,
    std::string_view subject);

}  // namespace engine
}  // namespace regexkit
