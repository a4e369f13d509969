/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <ostream>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "fxnum/number.hpp"

namespace fxnum {

inline std::ostream& operator<<(std::ostream& out, const Number& value) {
    return out << value.to_decimal_string();
}

} // namespace fxnum

// Formats with the family's natural number of decimal places; string_view
// format specs (width, alignment) apply to the resulting text.
template <>
struct fmt::formatter<fxnum::Number> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const fxnum::Number& value, FormatContext& ctx) const {
        const std::string text = value.to_decimal_string();
        return fmt::formatter<std::string_view>::format(text, ctx);
    }
};
