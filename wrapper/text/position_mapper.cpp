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

#include "text/position_mapper.h"
#include "diagnostics.h"
#include <unicode/locid.h>
#include <unicode/utf8.h>
#include <cstdint>
#include <limits>
#include <sstream>

namespace regexkit {
namespace text {

PositionMapper::PositionMapper(std::string_view subject, Encoding encoding)
    : subject_(subject.data() ? subject : std::string_view("", 0)),
      encoding_(encoding) {

    if (encoding_ != Encoding::kUTF8) {
        return;  // Latin-1: one byte = one code point = one cluster
    }

    // BreakIterator offsets are int32_t
    if (subject_.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        diag::warning("PositionMapper",
                      "subject too large for ICU break iterator, grapheme indices follow code points");
        return;
    }

    UErrorCode status = U_ZERO_ERROR;
    utext_ = utext_openUTF8(nullptr, subject_.data(),
                            static_cast<int64_t>(subject_.size()), &status);
    if (U_FAILURE(status)) {
        diag::warning("PositionMapper", std::string("utext_openUTF8 failed: ") + u_errorName(status));
        utext_close(utext_);
        utext_ = nullptr;
        return;
    }

    std::unique_ptr<icu::BreakIterator> breaker(
        icu::BreakIterator::createCharacterInstance(icu::Locale::getRoot(), status));
    if (U_SUCCESS(status)) {
        breaker->setText(utext_, status);
    }
    if (U_FAILURE(status)) {
        diag::warning("PositionMapper",
                      std::string("grapheme break iterator unavailable (") + u_errorName(status) +
                      "), grapheme indices follow code points");
        return;
    }

    breaker_ = std::move(breaker);
}

PositionMapper::~PositionMapper() {
    // Iterator references the UText, release it first
    breaker_.reset();
    if (utext_) {
        utext_close(utext_);
    }
}

size_t PositionMapper::countCodePoints(size_t from, size_t to) const {
    if (encoding_ == Encoding::kLatin1) {
        return to - from;
    }

    const auto* s = reinterpret_cast<const uint8_t*>(subject_.data());
    const int64_t length = static_cast<int64_t>(subject_.size());
    int64_t i = static_cast<int64_t>(from);
    const int64_t limit = static_cast<int64_t>(to);
    int64_t start = i;
    size_t count = 0;

    while (i < limit) {
        start = i;
        UChar32 c;
        U8_NEXT(s, i, length, c);
        if (c < 0) {
            i = start + 1;  // ill-formed: each byte is its own code point
        }
        count++;
    }

    if (i != limit) {
        std::ostringstream msg;
        msg << "offset " << to << " splits the UTF-8 sequence at bytes ["
            << start << ", " << i << ")";
        diag::engineContractViolation("PositionMapper", msg.str());
    }

    return count;
}

bool PositionMapper::illFormedAt(size_t pos) const {
    const auto* s = reinterpret_cast<const uint8_t*>(subject_.data());
    int64_t i = static_cast<int64_t>(pos);
    UChar32 c;
    U8_NEXT(s, i, static_cast<int64_t>(subject_.size()), c);
    return c < 0;
}

size_t PositionMapper::wellFormedEnd(size_t from, size_t to) const {
    const auto* s = reinterpret_cast<const uint8_t*>(subject_.data());
    const int64_t length = static_cast<int64_t>(subject_.size());
    int64_t i = static_cast<int64_t>(from);

    while (i < static_cast<int64_t>(to)) {
        const int64_t start = i;
        UChar32 c;
        U8_NEXT(s, i, length, c);
        if (c < 0) {
            return static_cast<size_t>(start);
        }
    }
    return to;
}

Position PositionMapper::locate(size_t offset) {
    if (offset > subject_.size()) {
        std::ostringstream msg;
        msg << "offset " << offset << " is past the end of a " << subject_.size()
            << "-byte subject";
        diag::engineContractViolation("PositionMapper", msg.str());
    }

    if (offset < cursor_.offset) {
        cursor_ = checkpoint_.offset <= offset ? checkpoint_ : Cursor{};
    }

    if (!breaker_) {
        const size_t code_points = countCodePoints(cursor_.offset, offset);
        cursor_.offset = offset;
        cursor_.code_point += code_points;
        cursor_.grapheme += code_points;
        return Position{offset, cursor_.code_point, cursor_.grapheme, true};
    }

    // Advance whole clusters; the cursor always rests on a cluster boundary.
    // ICU folds an ill-formed subpart into one U+FFFD cluster, here every
    // ill-formed byte is a cluster of its own.
    while (cursor_.offset < offset) {
        size_t next;
        if (illFormedAt(cursor_.offset)) {
            next = cursor_.offset + 1;
        } else {
            const int32_t boundary = breaker_->following(static_cast<int32_t>(cursor_.offset));
            if (boundary == icu::BreakIterator::DONE) {
                break;
            }
            next = wellFormedEnd(cursor_.offset, static_cast<size_t>(boundary));
        }
        if (next > offset) {
            break;
        }
        cursor_.code_point += countCodePoints(cursor_.offset, next);
        cursor_.offset = next;
        cursor_.grapheme++;
    }

    if (cursor_.offset == offset) {
        return Position{offset, cursor_.code_point, cursor_.grapheme, true};
    }

    // Inside the cluster that starts at the cursor
    return Position{
        offset,
        cursor_.code_point + countCodePoints(cursor_.offset, offset),
        cursor_.grapheme,
        false};
}

PositionRange PositionMapper::map(size_t offset, size_t length) {
    if (offset > subject_.size() || length > subject_.size() - offset) {
        std::ostringstream msg;
        msg << "range [" << offset << ", +" << length << ") is past the end of a "
            << subject_.size() << "-byte subject";
        diag::engineContractViolation("PositionMapper", msg.str());
    }

    PositionRange range;
    range.start = locate(offset);
    range.end = locate(offset + length);
    return range;
}

void PositionMapper::checkpoint() {
    checkpoint_ = cursor_;
}

}  // namespace text
}  // namespace regexkit
