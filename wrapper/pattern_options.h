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
#include <cstdint>
#include <string>

namespace regexkit {
namespace api {

/**
 * Pattern compilation options (mirrors RE2::Options).
 *
 * Used for:
 * 1. Configuring RE2 pattern compilation
 * 2. Telling the position mapper how the subject is encoded
 * 3. JSON configuration (all fields optional, missing fields use defaults)
 */
struct PatternOptions {
    // ========== BOOLEAN OPTIONS ==========
    bool posix_syntax = false;      // POSIX egrep syntax (not Perl)
    bool longest_match = false;     // Leftmost-longest match (not first)
    bool log_errors = false;        // Let RE2 log parse errors itself
    bool literal = false;           // Treat pattern as literal string (not regex)
    bool never_nl = false;          // Never match \n
    bool dot_nl = false;            // Dot matches everything including \n
    bool never_capture = false;     // Parse all parens as non-capturing
    bool case_sensitive = true;     // Case-sensitive matching
    bool perl_classes = false;      // Allow \d \s \w (POSIX mode only)
    bool word_boundary = false;     // Allow \b \B (POSIX mode only)
    bool one_line = false;          // ^ and $ match only start/end of text (POSIX mode only)

    // ========== ENCODING ==========
    bool utf8 = true;               // true=UTF8, false=Latin1

    // ========== MEMORY LIMIT ==========
    int64_t max_mem = 8388608;      // 8MB default

    /**
     * Convert to RE2::Options.
     *
     * @return RE2::Options with all fields set from this struct
     */
    RE2::Options toRE2Options() const;

    /**
     * Recover options from RE2::Options.
     *
     * Used when a Regex is built around an already compiled RE2 object.
     *
     * @param opts RE2::Options object
     * @return PatternOptions carrying the same values
     */
    static PatternOptions fromRE2Options(const RE2::Options& opts);

    /**
     * Parse options from JSON string.
     *
     * JSON format:
     * {
     *   "case_sensitive": true,
     *   "encoding": "UTF8",       // or "Latin1"
     *   "posix_syntax": false,
     *   "longest_match": false,
     *   "log_errors": false,
     *   "literal": false,
     *   "never_nl": false,
     *   "dot_nl": false,
     *   "never_capture": false,
     *   "perl_classes": false,
     *   "word_boundary": false,
     *   "one_line": false,
     *   "max_mem": 8388608
     * }
     *
     * All fields optional - missing fields use defaults.
     *
     * @param json JSON string with options (empty = defaults)
     * @return PatternOptions struct
     * @throws std::runtime_error if JSON invalid or a field has the wrong type
     */
    static PatternOptions fromJson(const std::string& json);

    /**
     * Serialize options to JSON (same field names as fromJson()).
     *
     * @return JSON string
     */
    std::string toJson() const;

    /**
     * Create default options.
     *
     * Equivalent to RE2::Options() constructor defaults, except that
     * log_errors is off.
     */
    static PatternOptions defaults();

    /**
     * Create options from simple case_sensitive flag.
     *
     * @param case_sensitive case sensitivity flag
     * @return PatternOptions with case_sensitive set, others default
     */
    static PatternOptions fromCaseSensitive(bool case_sensitive);

    bool operator==(const PatternOptions& other) const = default;
};

}  // namespace api
}  // namespace regexkit
