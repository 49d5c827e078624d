/// @file amount_scanner.h
/// @brief Scanners that recognize and capture price amounts
///
/// This file provides the character-level scanners used by the price
/// pipeline:
///
/// - Counting amount occurrences in plain (visible) text
/// - Locating currency markers in serialized markup
/// - Capturing the digit run that follows a marker, skipping markup tags
///   and recording where every captured character came from
///
/// All scanners are explicit state machines over a string view; no regular
/// expression engine is involved.
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef REPRICER_CPP_AMOUNT_SCANNER_H
#define REPRICER_CPP_AMOUNT_SCANNER_H

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace repricer_cpp {

/// @brief The currency marker that starts every amount
inline constexpr char kCurrencyMarker = '$';

/// @struct AmountToken
/// @brief The result of capturing one amount from a markup string
///
/// `characters` and `offsets` always have the same length. Offsets are
/// strictly increasing and each one indexes the character of the original
/// markup that was captured at that position. Trailing separators have
/// already been trimmed from both sequences.
struct AmountToken {
    std::string characters;            ///< Captured digits, '.' and ','
    std::vector<std::size_t> offsets;  ///< Source offset of each captured character
    std::optional<double> value;       ///< Parsed value; empty if the run does not parse
};

/// @brief Check if a character can be part of an amount's digit run
/// @param[in] c The character to check
/// @retval true for digits, '.' and ','
/// @retval false otherwise
bool isAmountCharacter(char c);

/// @brief Count the amounts in a run of visible text
///
/// An amount is the marker followed either by a digit and any run of
/// digits, '.' and ',', or by '.' and two digits (no integer part).
/// Occurrences are counted left to right without overlap.
///
/// @param[in] text Visible text (no markup)
/// @return Number of amounts found
std::size_t countAmounts(std::string_view text);

/// @brief Find the markers of a markup string that sit outside tags
///
/// Markers inside a tag (attribute values, tag names, comments) are not
/// amounts and are left out.
///
/// @param[in] markup Serialized inner markup of an element
/// @return Marker offsets in increasing order
std::vector<std::size_t> findMarkers(std::string_view markup);

/// @brief Capture the amount that follows a marker
///
/// Scans forward from `markerOffset + 1`. Characters between '<' and '>'
/// are skipped, and so are whole comments, which may contain '>'. Outside
/// tags, digits, '.' and ',' are captured together with their offsets; the
/// first other character ends the run. Trailing '.' and ',' are trimmed
/// before the value is parsed.
///
/// @param[in] markup The markup string
/// @param[in] markerOffset Offset of the marker character inside `markup`
/// @return The captured token (possibly empty)
AmountToken captureAmount(std::string_view markup, std::size_t markerOffset);

/// @brief Check if a captured run has the shape of an amount
///
/// Applies the same pattern as countAmounts() to the captured characters:
/// a leading digit, or '.' followed by two digits.
///
/// @param[in] token A token produced by captureAmount()
/// @retval true if the token should be adjusted
/// @retval false if the marker is not followed by an amount
bool isAmountRun(AmountToken const& token);

/// @brief Parse captured amount characters into a number
///
/// Every character other than digits and '.' is dropped (grouping
/// separators), then the longest prefix holding at most one decimal point is
/// parsed.
///
/// @param[in] characters Captured characters
/// @return The value, or std::nullopt if nothing numeric remains
std::optional<double> parseAmountValue(std::string_view characters);

} // namespace repricer_cpp

#endif // REPRICER_CPP_AMOUNT_SCANNER_H
