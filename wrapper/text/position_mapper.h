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

#include "text/position.h"
#include <unicode/brkiter.h>
#include <unicode/utext.h>
#include <memory>
#include <string_view>

namespace regexkit {
namespace text {

enum class Encoding {
    kUTF8,
    kLatin1,
};

/**
 * Position Mapper - turns RE2 byte offsets into Positions.
 *
 * Walks the subject grapheme cluster by grapheme cluster (ICU character
 * BreakIterator over a UTF-8 UText, so boundaries come back as byte offsets)
 * counting bytes, code points and clusters until the requested offset is
 * reached.
 *
 * The walk keeps a monotonic cursor. Offsets must mostly arrive in ascending
 * order, which is what one findAll() produces: match starts never go
 * backwards. Capture groups of one match may start before the previous
 * group's end, so callers set a checkpoint at each match start and a rewind
 * goes back to the checkpoint rather than to the start of the subject.
 *
 * Encoding rules:
 * - UTF-8: every ill-formed byte counts as one code point and one cluster,
 *   and no cluster spans an ill-formed byte. Over ill-formed input the
 *   grapheme index therefore equals the code point index.
 * - Latin-1: every byte is one code point and one cluster.
 * - If ICU cannot build a break iterator, clusters are counted as code points
 *   (a warning is logged).
 *
 * Not thread-safe. One mapper per matching call, borrowed subject must
 * outlive it.
 */
class PositionMapper {
public:
    PositionMapper(std::string_view subject, Encoding encoding);
    ~PositionMapper();

    PositionMapper(const PositionMapper&) = delete;
    PositionMapper& operator=(const PositionMapper&) = delete;

    /**
     * Map one byte offset.
     *
     * Fails fast (abort) if offset is past the end of the subject or splits
     * a well-formed UTF-8 sequence.
     *
     * @param offset byte offset reported by the engine
     * @return position of offset
     */
    Position locate(size_t offset);

    /**
     * Map an engine (offset, length) pair.
     *
     * Fails fast if offset + length is past the end of the subject.
     *
     * @param offset byte offset of the range start
     * @param length byte length of the range
     * @return range whose slice is exactly [offset, offset + length)
     */
    PositionRange map(size_t offset, size_t length);

    /**
     * Remember the current cursor. Rewinds after this point restart from
     * here instead of from the subject start.
     */
    void checkpoint();

    /**
     * True when clusters come from ICU, false when they fall back to code
     * points (Latin-1 subjects, or ICU failure).
     */
    bool graphemeAware() const { return breaker_ != nullptr; }

private:
    struct Cursor {
        size_t offset = 0;
        size_t code_point = 0;
        size_t grapheme = 0;
    };

    size_t countCodePoints(size_t from, size_t to) const;
    bool illFormedAt(size_t pos) const;
    // Start of the first ill-formed sequence in [from, to), or to
    size_t wellFormedEnd(size_t from, size_t to) const;

    std::string_view subject_;
    Encoding encoding_;
    UText* utext_ = nullptr;
    std::unique_ptr<icu::BreakIterator> breaker_;
    Cursor cursor_;
    Cursor checkpoint_;
};

}  // namespace text
}  // namespace regexkit
