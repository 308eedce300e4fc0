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

#include "regexkit.h"
#include <memory>
#include <string>
#include <string_view>

namespace regexkit {
namespace api {

/**
 * Escapes regex metacharacters so text can be embedded in a pattern literally.
 *
 * Escaped characters: - [ ] / { } ( ) * + ? . \ ^ $ |
 * Each one gets exactly one backslash in front, everything else is copied.
 * Example: "1.5-2.0?" -> "1\.5\-2\.0\?"
 *
 * Not idempotent: escaping "\." again gives "\\\." because the backslash is
 * itself in the table.
 *
 * Build one Escaper and share it (const, thread-safe); the metacharacter
 * pattern is compiled once per instance.
 */
class Escaper {
public:
    /** Characters that get a backslash. */
    static constexpr std::string_view kMetacharacters = "-[]/{}()*+?.\\^$|";

    /** Single-character class matching any of kMetacharacters. */
    static constexpr const char* kMetacharacterPattern =
        R"([\-\[\]\/\{\}\(\)\*\+\?\.\\\^\$\|])";

    /**
     * Compile kMetacharacterPattern.
     */
    Escaper();

    /**
     * Use an already compiled metacharacter pattern. Every match of the
     * pattern is escaped.
     *
     * @throws std::invalid_argument if metacharacters is null
     */
    explicit Escaper(std::shared_ptr<const Regex> metacharacters);

    /**
     * Escape text.
     *
     * @param text input text
     * @return text with a backslash before every metacharacter (text itself
     *         if it has none)
     */
    std::string escape(std::string_view text) const;

    const Regex& metacharacters() const { return *metacharacters_; }

private:
    std::shared_ptr<const Regex> metacharacters_;
};

/**
 * Escape with a temporary Escaper. Compiles the metacharacter pattern on
 * every call; keep an Escaper around for repeated use.
 */
std::string escape(std::string_view text);

}  // namespace api
}  // namespace regexkit
