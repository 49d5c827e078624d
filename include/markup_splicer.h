/// @file markup_splicer.h
/// @brief Splicing reformatted amounts back into markup
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef REPRICER_CPP_MARKUP_SPLICER_H
#define REPRICER_CPP_MARKUP_SPLICER_H

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace repricer_cpp {

/// @brief Replace the characters of a captured amount with a new amount
///
/// `offsets` and `replacement` are aligned from the right: the last offset
/// receives the last replacement character, and so on. When the replacement
/// is shorter, the leftmost mapped characters are removed. When it is
/// longer, the remaining prefix is written at the first mapped offset,
/// ahead of the character aligned there. Every character of `markup` that is
/// not listed in `offsets` is copied unchanged, so tags that interrupt the
/// digit run keep their place.
///
/// @param[in] markup The original markup (not modified)
/// @param[in] offsets Strictly increasing offsets of the captured characters
/// @param[in] replacement The formatted amount to write
/// @return The spliced markup
///
/// @code{.cpp}
/// spliceAmount("$1<b>2</b>3.00", {1, 5, 10, 11, 12, 13}, "124.00");
/// // "$1<b>2</b>4.00"
/// spliceAmount("$9.99", {1, 2, 3, 4}, "10.01");
/// // "$10.01"
/// @endcode
std::string spliceAmount(std::string_view markup,
                         std::vector<std::size_t> const& offsets,
                         std::string_view replacement);

} // namespace repricer_cpp

#endif // REPRICER_CPP_MARKUP_SPLICER_H
