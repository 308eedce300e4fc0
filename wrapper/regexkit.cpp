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

#include "regexkit.h"
#include <nlohmann/json.hpp>
#include <utility>

using json = nlohmann::json;

namespace regexkit {
namespace api {

namespace {

std::shared_ptr<const RE2> compileOrThrow(
    const std::string& pattern,
    const PatternOptions& options) {

    CompileError error;
    auto compiled = engine::compile(pattern, options.toRE2Options(), error);
    if (!compiled) {
        throw CompileException(std::move(error));
    }
    return compiled;
}

}  // namespace

//============================================================================
// CompileException
//============================================================================

CompileException::CompileException(CompileError error)
    : std::runtime_error("Invalid pattern: " + error.message),
      error_(std::move(error)) {}

//============================================================================
// Construction
//============================================================================

std::unique_ptr<Regex> Regex::compile(
    const std::string& pattern,
    const PatternOptions& options,
    CompileError& error_out) {

    auto compiled = engine::compile(pattern, options.toRE2Options(), error_out);
    if (!compiled) {
        return nullptr;  // Compilation error
    }

    return std::unique_ptr<Regex>(new Regex(std::move(compiled), options));
}

std::unique_ptr<Regex> Regex::compile(
    const std::string& pattern,
    CompileError& error_out) {
    return compile(pattern, PatternOptions::defaults(), error_out);
}

Regex::Regex(const std::string& pattern, const PatternOptions& options)
    : Regex(compileOrThrow(pattern, options), options) {}

Regex::Regex(std::shared_ptr<const RE2> compiled)
    : compiled_(std::move(compiled)) {

    if (!compiled_) {
        throw std::invalid_argument("Regex: compiled pattern is null");
    }
    if (!compiled_->ok()) {
        throw std::invalid_argument("Regex: compiled pattern is not valid: " + compiled_->error());
    }

    pattern_ = compiled_->pattern();
    options_ = PatternOptions::fromRE2Options(compiled_->options());
    names_ = std::make_shared<const GroupNames>(compiled_->NamedCapturingGroups());
}

Regex::Regex(std::shared_ptr<const RE2> compiled, const PatternOptions& options)
    : compiled_(std::move(compiled)),
      pattern_(compiled_->pattern()),
      options_(options),
      names_(std::make_shared<const GroupNames>(compiled_->NamedCapturingGroups())) {}

//============================================================================
// Matching
//============================================================================

text::Encoding Regex::encoding() const {
    return options_.utf8 ? text::Encoding::kUTF8 : text::Encoding::kLatin1;
}

std::vector<Match> Regex::findAll(std::string_view subject) const {
    std::vector<engine::RawMatch> raw = engine::findAllMatches(*compiled_, subject);

    std::vector<Match> matches;
    if (raw.empty()) {
        return matches;
    }

    // One copy of the subject shared by every match
    auto owned = std::make_shared<const std::string>(subject);
    text::PositionMapper mapper(*owned, encoding());

    matches.reserve(raw.size());
    for (const engine::RawMatch& r : raw) {
        matches.emplace_back(owned, r, mapper, names_);
    }
    return matches;
}

std::optional<Match> Regex::first(std::string_view subject, RE2::Anchor anchor) const {
    std::optional<engine::RawMatch> raw = engine::firstMatch(*compiled_, subject, anchor);
    if (!raw) {
        return std::nullopt;
    }

    auto owned = std::make_shared<const std::string>(subject);
    text::PositionMapper mapper(*owned, encoding());
    return Match(std::move(owned), *raw, mapper, names_);
}

std::optional<Match> Regex::match(std::string_view subject) const {
    return first(subject, RE2::ANCHOR_START);
}

std::optional<Match> Regex::search(std::string_view subject) const {
    return first(subject, RE2::UNANCHORED);
}

bool Regex::testMatch(std::string_view subject) const {
    return match(subject).has_value();
}

bool Regex::testSearch(std::string_view subject) const {
    return search(subject).has_value();
}

//============================================================================
// Pattern introspection
//============================================================================

int Regex::numberOfCaptureGroups() const {
    return compiled_->NumberOfCapturingGroups();
}

int Regex::programSize() const {
    return compiled_->ProgramSize();
}

std::string Regex::infoJson() const {
    json j;
    j["pattern"] = pattern_;
    j["capturing_groups"] = numberOfCaptureGroups();
    j["named_groups"] = json::object();
    for (const auto& [name, index] : *names_) {
        j["named_groups"][name] = index;
    }
    j["program_size"] = programSize();
    j["options"] = json::parse(options_.toJson());
    // Latin-1 patterns are not valid UTF-8
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace api
}  // namespace regexkit
