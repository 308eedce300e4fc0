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
#include "diagnostics.h"
#include <sstream>
#include <stdexcept>
#include <utility>

namespace regexkit {
namespace api {

Match::Match(
    std::shared_ptr<const std::string> subject,
    const engine::RawMatch& raw,
    text::PositionMapper& mapper,
    std::shared_ptr<const GroupNames> names)
    : subject_(std::move(subject)),
      names_(std::move(names)) {

    if (!subject_) {
        diag::engineContractViolation("Match", "no subject");
    }

    // Check the overall match first. Shouldn't happen
    if (raw.groups.empty() || !raw.groups[0].found()) {
        diag::engineContractViolation("Match", "match result has no overall match range");
    }

    const engine::RawSpan& whole = raw.groups[0];

    // Capture groups lie inside the whole match, rewinds stop at its start
    mapper.locate(whole.offset);
    mapper.checkpoint();

    ranges_.reserve(raw.groups.size());
    for (const engine::RawSpan& span : raw.groups) {
        if (!span.found()) {
            ranges_.emplace_back(std::nullopt);
            continue;
        }
        ranges_.emplace_back(mapper.map(span.offset, span.length));
    }
}

void Match::checkIndex(size_t index) const {
    if (index >= ranges_.size()) {
        std::ostringstream msg;
        msg << "Match group index " << index << " is out of range (match has "
            << ranges_.size() << " ranges)";
        throw std::out_of_range(msg.str());
    }
}

std::string Match::substring(size_t index) const {
    checkIndex(index);

    const auto& r = ranges_[index];
    if (!r) {
        return "";
    }
    return subject_->substr(r->start.offset, r->length());
}

std::string Match::substring(const std::string& name) const {
    if (names_) {
        auto it = names_->find(name);
        if (it != names_->end()) {
            return substring(static_cast<size_t>(it->second));
        }
    }
    throw std::out_of_range("Match has no capture group named '" + name + "'");
}

bool Match::matched(size_t index) const {
    checkIndex(index);
    return ranges_[index].has_value();
}

const std::optional<text::PositionRange>& Match::range(size_t index) const {
    checkIndex(index);
    return ranges_[index];
}

}  // namespace api
}  // namespace regexkit
