/// @file amount_scanner.cpp
/// @brief Amount counting, marker lookup and digit-run capture
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "amount_scanner.h"

#include <charconv>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace repricer_cpp {

namespace {

/// States of the forward capture scan started at a marker.
enum class CaptureState {
    Capturing,  ///< Outside a tag, collecting amount characters
    InTag,      ///< Between '<' and '>', characters are skipped
    Done        ///< A non-amount character ended the run
};

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

bool isSeparator(char c) {
    return c == '.' || c == ',';
}

// Length of the amount starting right after a marker at `pos - 1`, or 0 if
// the characters at `pos` do not form one.
std::size_t amountLengthAt(std::string_view text, std::size_t pos) {
    if (pos < text.size() && isDigit(text[pos])) {
        std::size_t end = pos;
        while (end < text.size() && isAmountCharacter(text[end])) {
            ++end;
        }
        return end - pos;
    }
    if (pos + 2 < text.size() && text[pos] == '.' && isDigit(text[pos + 1]) && isDigit(text[pos + 2])) {
        return 3;
    }
    return 0;
}

bool opensComment(std::string_view markup, std::size_t pos) {
    return markup.compare(pos, 4, "<!--") == 0;
}

// Offset of the '>' that closes the comment opening at `pos`, or npos if it
// is never closed. Comments may contain '>' before their terminator, so
// they cannot be skipped like tags.
std::size_t commentEnd(std::string_view markup, std::size_t pos) {
    std::size_t close = markup.find("-->", pos + 4);
    return close == std::string_view::npos ? close : close + 2;
}

} // namespace

bool isAmountCharacter(char c) {
    return isDigit(c) || isSeparator(c);
}

std::size_t countAmounts(std::string_view text) {
    std::size_t count = 0;
    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] != kCurrencyMarker) {
            ++i;
            continue;
        }
        std::size_t length = amountLengthAt(text, i + 1);
        if (length == 0) {
            ++i;
            continue;
        }
        ++count;
        i += 1 + length;
    }
    return count;
}

std::vector<std::size_t> findMarkers(std::string_view markup) {
    std::vector<std::size_t> markers;
    bool inTag = false;
    for (std::size_t i = 0; i < markup.size(); ++i) {
        char c = markup[i];
        if (inTag) {
            if (c == '>') inTag = false;
            continue;
        }
        if (c == '<') {
            if (opensComment(markup, i)) {
                i = commentEnd(markup, i);
                if (i == std::string_view::npos) break;
                continue;
            }
            inTag = true;
            continue;
        }
        if (c == kCurrencyMarker) {
            markers.push_back(i);
        }
    }
    return markers;
}

AmountToken captureAmount(std::string_view markup, std::size_t markerOffset) {
    AmountToken token;
    CaptureState state = CaptureState::Capturing;

    for (std::size_t i = markerOffset + 1; i < markup.size() && state != CaptureState::Done; ++i) {
        char c = markup[i];
        switch (state) {
            case CaptureState::InTag:
                if (c == '>') state = CaptureState::Capturing;
                break;
            case CaptureState::Capturing:
                if (c == '<' && opensComment(markup, i)) {
                    std::size_t end = commentEnd(markup, i);
                    if (end == std::string_view::npos) {
                        state = CaptureState::Done;
                    } else {
                        i = end;
                    }
                } else if (c == '<') {
                    state = CaptureState::InTag;
                } else if (isAmountCharacter(c)) {
                    token.characters.push_back(c);
                    token.offsets.push_back(i);
                } else {
                    state = CaptureState::Done;
                }
                break;
            case CaptureState::Done:
                break;
        }
    }

    // A run never ends in a separator ("$5.00." at the end of a sentence).
    while (!token.characters.empty() && isSeparator(token.characters.back())) {
        token.characters.pop_back();
        token.offsets.pop_back();
    }

    token.value = parseAmountValue(token.characters);
    return token;
}

bool isAmountRun(AmountToken const& token) {
    std::string const& chars = token.characters;
    if (chars.empty()) return false;
    if (isDigit(chars[0])) return true;
    return chars.size() >= 3 && chars[0] == '.' && isDigit(chars[1]) && isDigit(chars[2]);
}

std::optional<double> parseAmountValue(std::string_view characters) {
    std::string numeric;
    numeric.reserve(characters.size() + 1);
    bool seenPoint = false;
    bool seenDigit = false;
    for (char c : characters) {
        if (isDigit(c)) {
            numeric.push_back(c);
            seenDigit = true;
        } else if (c == '.') {
            // Only the first decimal point is meaningful.
            if (seenPoint) break;
            numeric.push_back(c);
            seenPoint = true;
        }
    }
    if (!seenDigit) return std::nullopt;
    if (numeric.front() == '.') {
        numeric.insert(numeric.begin(), '0');
    }

    double value = 0.0;
    char const* first = numeric.data();
    char const* last = numeric.data() + numeric.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr == first) {
        return std::nullopt;
    }
    return value;
}

} // namespace repricer_cpp
