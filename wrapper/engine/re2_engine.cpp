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

#include "engine/re2_engine.h"
#include <unicode/utf8.h>
#include <cstdint>

namespace regexkit {
namespace engine {

namespace {

// RE2 reports unset groups as null StringPieces, so the subject itself must
// never have a null data pointer (an empty match on it would look unset).
std::string_view nonNull(std::string_view subject) {
    return subject.data() ? subject : std::string_view("", 0);
}

bool matchAt(
    const RE2& re,
    std::string_view subject,
    size_t startpos,
    RE2::Anchor anchor,
    RawMatch& out) {

    const int n_groups = re.NumberOfCapturingGroups() + 1;
    std::vector<re2::StringPiece> submatch(n_groups);
    re2::StringPiece text(subject.data(), subject.size());

    if (!re.Match(text, startpos, subject.size(), anchor, submatch.data(), n_groups)) {
        return false;
    }

    out.groups.assign(n_groups, RawSpan{});
    for (int i = 0; i < n_groups; i++) {
        if (submatch[i].data() == nullptr) {
            continue;  // Optional group did not participate
        }
        out.groups[i].offset = static_cast<size_t>(submatch[i].data() - subject.data());
        out.groups[i].length = submatch[i].size();
    }
    return true;
}

// Length of the character starting at pos (1 past the end of subject, and
// 1 for each byte of an ill-formed UTF-8 sequence)
size_t charLength(const RE2& re, std::string_view subject, size_t pos) {
    if (pos >= subject.size() || re.options().encoding() != RE2::Options::EncodingUTF8) {
        return 1;
    }
    const auto* s = reinterpret_cast<const uint8_t*>(subject.data());
    int64_t i = static_cast<int64_t>(pos);
    UChar32 c;
    U8_NEXT(s, i, static_cast<int64_t>(subject.size()), c);
    if (c < 0) {
        return 1;
    }
    return static_cast<size_t>(i) - pos;
}

}  // namespace

std::shared_ptr<const RE2> compile(
    const std::string& pattern,
    const RE2::Options& options,
    CompileError& error_out) {

    auto regex = std::make_shared<RE2>(pattern, options);

    if (!regex->ok()) {
        error_out.code = static_cast<int>(regex->error_code());
        error_out.message = regex->error();
        error_out.fragment = regex->error_arg();
        return nullptr;
    }

    return regex;
}

std::optional<RawMatch> firstMatch(
    const RE2& re,
    std::string_view subject,
    RE2::Anchor anchor) {

    subject = nonNull(subject);

    RawMatch match;
    if (!matchAt(re, subject, 0, anchor, match)) {
        return std::nullopt;
    }
    return match;
}

std::vector<RawMatch> findAllMatches(
    const RE2& re,
    std::string_view subject) {

    subject = nonNull(subject);

    std::vector<RawMatch> matches;
    size_t pos = 0;

    while (pos <= subject.size()) {
        RawMatch match;
        if (!matchAt(re, subject, pos, RE2::UNANCHORED, match)) {
            break;
        }

        const RawSpan whole = match.groups[0];
        matches.push_back(std::move(match));

        if (!whole.found()) {
            break;  // Broken result, rejected when the Match is built
        }

        const size_t end = whole.offset + whole.length;
        pos = whole.length == 0 ? end + charLength(re, subject, end) : end;
    }

    return matches;
}

}  // namespace engine
}  // namespace regexkit
