/// @file adjustment.h
/// @brief Price adjustments and amount formatting
///
/// An Adjustment describes how every located amount is changed: by a fixed
/// delta or by a percentage of its own value. Results are rounded half-up to
/// two decimals and formatted with comma grouping and a period decimal.
///
/// @code{.cpp}
/// auto cut = Adjustment::parse("-14%");
/// applyAdjustment(100.0, *cut);            // "86.00"
/// applyAdjustment(1234.5, Adjustment{});   // "1,234.50"
/// @endcode
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef REPRICER_CPP_ADJUSTMENT_H
#define REPRICER_CPP_ADJUSTMENT_H

#include <optional>
#include <string>
#include <string_view>

namespace repricer_cpp {

/// @struct Adjustment
/// @brief A uniform change applied to every amount
struct Adjustment {
    /// @enum Kind
    /// @brief How `delta` is interpreted
    enum class Kind {
        Absolute,  ///< Added to the amount as is
        Percent    ///< Percentage of the amount added to it
    };

    Kind kind = Kind::Absolute;
    double delta = 0.0;

    /// @brief Create an adjustment that adds `delta` to every amount
    static Adjustment absolute(double delta);

    /// @brief Create an adjustment that changes every amount by `delta` percent
    static Adjustment percent(double delta);

    /// @brief Parse the textual form of an adjustment
    ///
    /// Accepts a signed decimal number ("-2.46", "+7395") for an absolute
    /// adjustment, or a signed decimal number followed by '%' ("-14%",
    /// "39.2%") for a percentage. Surrounding whitespace is ignored.
    ///
    /// @param[in] text The adjustment text
    /// @return The adjustment, or std::nullopt if `text` is malformed or not finite
    static std::optional<Adjustment> parse(std::string_view text);
};

/// @brief Compute the adjusted value before rounding
/// @param[in] value The original amount
/// @param[in] adjustment The adjustment to apply
/// @return `value + delta` or `value + value * delta / 100`
double adjustedValue(double value, Adjustment const& adjustment);

/// @brief Insert ',' between groups of three digits, counting from the right
/// @param[in] digits A run of decimal digits
/// @return The grouped digits ("1234567" becomes "1,234,567")
std::string groupThousands(std::string_view digits);

/// @brief Round a value half-up to two decimals and format it
///
/// Rounding works on the shortest decimal text that reads back as `value`,
/// so 1.005 becomes "1.01" while 0.004999999995 stays "0.00". Halves round
/// away from zero. The integer part is grouped with ',' and negative results
/// carry a leading '-'. Values of any finite magnitude are formatted.
///
/// @param[in] value The value to format
/// @return The formatted amount, or std::nullopt if `value` is not finite
std::optional<std::string> formatAmount(double value);

/// @brief Apply an adjustment to an amount and format the result
/// @param[in] value The original amount
/// @param[in] adjustment The adjustment to apply
/// @return The formatted result, or std::nullopt if the result is not finite
std::optional<std::string> applyAdjustment(double value, Adjustment const& adjustment);

} // namespace repricer_cpp

#endif // REPRICER_CPP_ADJUSTMENT_H
