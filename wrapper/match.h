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
#include "text/position.h"
#include "text/position_mapper.h"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace regexkit {
namespace api {

/**
 * Capture group name -> group index (as reported by RE2).
 */
using GroupNames = std::map<std::string, int>;

/**
 * Result of one successful match.
 *
 * Holds the subject (shared with every other Match from the same call) and
 * one position range per group: index 0 is the whole match, 1..N the capture
 * groups in pattern order. A group that did not take part in the match has
 * no range and an empty substring.
 *
 * Immutable after construction, safe to share between threads.
 */
class Match {
public:
    /**
     * Build a match from an engine result.
     *
     * Aborts the process if the engine reported the whole match as unset or
     * any offset outside the subject: a Match is only ever built from a
     * successful result.
     *
     * @param subject subject the engine ran on
     * @param raw engine result for one match
     * @param mapper position mapper over *subject (cursor is advanced)
     * @param names group name table of the pattern (nullptr = no names)
     */
    Match(std::shared_ptr<const std::string> subject,
          const engine::RawMatch& raw,
          text::PositionMapper& mapper,
          std::shared_ptr<const GroupNames> names = nullptr);

    /**
     * Count of the ranges, including the whole match.
     */
    size_t rangeCount() const { return ranges_.size(); }

    /**
     * Text of a group, with 0 being the entire match.
     *
     * @param index group index
     * @return matched text ("" if the group did not participate)
     * @throws std::out_of_range if index >= rangeCount()
     */
    std::string substring(size_t index) const;

    /**
     * Text of a named group.
     *
     * @throws std::out_of_range if the pattern has no group with that name
     */
    std::string substring(const std::string& name) const;

    std::string operator[](size_t index) const { return substring(index); }

    /**
     * Whether a group took part in the match.
     *
     * @throws std::out_of_range if index >= rangeCount()
     */
    bool matched(size_t index) const;

    /**
     * Position range of a group (std::nullopt if it did not participate).
     *
     * @throws std::out_of_range if index >= rangeCount()
     */
    const std::optional<text::PositionRange>& range(size_t index) const;

    /** Range of the whole match. */
    const text::PositionRange& wholeRange() const { return *ranges_.front(); }

    text::Position start() const { return wholeRange().start; }
    text::Position end() const { return wholeRange().end; }

    /** The subject that was matched. */
    const std::string& subject() const { return *subject_; }

private:
    void checkIndex(size_t index) const;

    std::shared_ptr<const std::string> subject_;
    std::vector<std::optional<text::PositionRange>> ranges_;
    std::shared_ptr<const GroupNames> names_;
};

}  // namespace api
}  // namespace regexkit
