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

#include "engine/re2_engine.h"
#include "match.h"
#include "pattern_options.h"
#include <re2/re2.h>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace regexkit {
namespace api {

using engine::CompileError;

/**
 * Thrown by the Regex constructor when the pattern does not compile.
 */
class CompileException : public std::runtime_error {
public:
    explicit CompileException(CompileError error);

    const CompileError& error() const { return error_; }

private:
    CompileError error_;
};

/**
 * Compiled pattern with a Python-like matching API.
 *
 * Usage:
 *   CompileError error;
 *   auto re = Regex::compile("(\\w+)@(\\w+)", PatternOptions::defaults(), error);
 *   if (!re) { ... error.message ... }
 *
 *   if (auto m = re->search("mail bob@example")) {
 *       m->substring(1);   // "bob"
 *   }
 *
 *   for (const Match& m : re->findAll(text)) { ... }
 *
 * match() anchors at the start of the subject only: "abc" matches "ab.*" and
 * "a", not "b". There is no full-string variant.
 *
 * Immutable. RE2 allows concurrent use of a const RE2, so one Regex may be
 * used from several threads at once.
 */
class Regex {
public:
    /**
     * Compile a pattern.
     *
     * @param pattern regex pattern string (RE2 syntax)
     * @param options compile options
     * @param error_out filled on failure
     * @return compiled Regex, or nullptr if the pattern is invalid
     */
    static std::unique_ptr<Regex> compile(
        const std::string& pattern,
        const PatternOptions& options,
        CompileError& error_out);

    /**
     * Compile a pattern with default options.
     */
    static std::unique_ptr<Regex> compile(
        const std::string& pattern,
        CompileError& error_out);

    /**
     * Compile a pattern.
     *
     * @throws CompileException if the pattern is invalid
     */
    explicit Regex(
        const std::string& pattern,
        const PatternOptions& options = PatternOptions::defaults());

    /**
     * Wrap an already compiled RE2 object. pattern() and options() are taken
     * from it.
     *
     * @throws std::invalid_argument if compiled is null or failed to compile
     */
    explicit Regex(std::shared_ptr<const RE2> compiled);

    /**
     * All non-overlapping matches, left to right.
     *
     * @param subject text to search
     * @return matches (empty vector if there are none; not an error)
     */
    std::vector<Match> findAll(std::string_view subject) const;

    /**
     * Match anchored at the start of subject (the match may end anywhere).
     *
     * @return the match, or std::nullopt
     */
    std::optional<Match> match(std::string_view subject) const;

    /**
     * First match anywhere in subject.
     *
     * @return the match, or std::nullopt
     */
    std::optional<Match> search(std::string_view subject) const;

    bool testMatch(std::string_view subject) const;
    bool testSearch(std::string_view subject) const;

    // ========== Pattern introspection ==========

    /** Exactly the text that was compiled. */
    const std::string& pattern() const { return pattern_; }
    const PatternOptions& options() const { return options_; }
    int numberOfCaptureGroups() const;
    const GroupNames& namedGroups() const { return *names_; }
    int programSize() const;

    /**
     * Pattern summary as JSON:
     * {"pattern": ..., "capturing_groups": N, "named_groups": {...},
     *  "program_size": N, "options": {...}}
     */
    std::string infoJson() const;

    /** Underlying RE2 object. */
    const RE2& engine() const { return *compiled_; }

private:
    Regex(std::shared_ptr<const RE2> compiled, const PatternOptions& options);

    std::optional<Match> first(std::string_view subject, RE2::Anchor anchor) const;
    text::Encoding encoding() const;

    std::shared_ptr<const RE2> compiled_;
    std::string pattern_;
    PatternOptions options_;
    std::shared_ptr<const GroupNames> names_;
};

}  // namespace api
}  // namespace regexkit
