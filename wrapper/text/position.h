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

#include <cstddef>

namespace regexkit {
namespace text {

/**
 * A location inside one subject string.
 *
 * offset is exact (bytes, the unit RE2 reports) so slicing never drifts.
 * code_point and grapheme are the same location counted in code points and
 * in extended grapheme clusters. When offset falls inside a cluster (the
 * engine matched a base letter but not its combining mark, for example),
 * grapheme is the index of the containing cluster and on_grapheme_boundary
 * is false.
 *
 * Positions are only meaningful for the subject they were derived from.
 */
struct Position {
    size_t offset = 0;
    size_t code_point = 0;
    size_t grapheme = 0;
    bool on_grapheme_boundary = true;

    bool operator==(const Position& other) const = default;
};

/**
 * Half-open range [start, end) within one subject. Never inverted.
 */
struct PositionRange {
    Position start;
    Position end;

    size_t length() const { return end.offset - start.offset; }
    bool empty() const { return start.offset == end.offset; }

    bool operator==(const PositionRange& other) const = default;
};

}  // namespace text
}  // namespace regexkit
