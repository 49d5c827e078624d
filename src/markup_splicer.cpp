/// @file markup_splicer.cpp
/// @brief Right-aligned amount splicing
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "markup_splicer.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace repricer_cpp {

std::string spliceAmount(std::string_view markup,
                         std::vector<std::size_t> const& offsets,
                         std::string_view replacement) {
    std::string out;
    out.reserve(markup.size() + replacement.size());

    auto const mapped = static_cast<std::ptrdiff_t>(offsets.size());
    auto const length = static_cast<std::ptrdiff_t>(replacement.size());

    std::size_t cursor = 0;
    for (std::ptrdiff_t j = 0; j < mapped; ++j) {
        std::size_t offset = offsets[static_cast<std::size_t>(j)];
        out.append(markup.substr(cursor, offset - cursor));

        // Index of the replacement character aligned with this offset.
        std::ptrdiff_t k = j + length - mapped;
        if (j == 0 && k > 0) {
            out.append(replacement.substr(0, static_cast<std::size_t>(k + 1)));
        } else if (k >= 0) {
            out.push_back(replacement[static_cast<std::size_t>(k)]);
        }
        cursor = offset + 1;
    }
    out.append(markup.substr(cursor));
    return out;
}

} // namespace repricer_cpp
