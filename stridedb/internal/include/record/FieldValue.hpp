/*
 * StrideDB
 * Copyright (C) 2026 Swift Storm Studio
 *
 * This file is part of StrideDB.
 *
 * StrideDB is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * StrideDB is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with StrideDB.  If not, see <https://www.gnu.org/licenses/>.
 */

// internal/include/record/FieldValue.hpp
#pragma once

#include "schema/Schema.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

namespace stridedb::record {
    /**
     * A decoded field value. Alternatives are listed in schema::FieldType
     * order, so value.index() == static_cast<size_t>(type) for every type
     * except VarString, which has no runtime representation.
     *
     * FixedString values are held in decoded (trimmed) form.
     */
    using FieldValue = std::variant<int32_t, int64_t, int16_t, bool, char16_t, std::string>;

    static_assert(std::variant_size_v<FieldValue> == static_cast<size_t>(schema::FieldType::VarString));

    [[nodiscard]] inline schema::FieldType type_of(const FieldValue& value) noexcept {
        return static_cast<schema::FieldType>(value.index());
    }

    /**
     * Widens an integer value to int64_t. Non-integer alternatives yield nullopt.
     */
    [[nodiscard]] inline std::optional<int64_t> as_integer(const FieldValue& value) noexcept {
        if (const auto* v = std::get_if<int32_t>(&value)) { return *v; }
        if (const auto* v = std::get_if<int64_t>(&value)) { return *v; }
        if (const auto* v = std::get_if<int16_t>(&value)) { return *v; }
        return std::nullopt;
    }

    /**
     * Human-readable rendering for logs and diagnostics.
     */
    [[nodiscard]] inline std::string to_string(const FieldValue& value) {
        return std::visit([]<typename T>(const T& v) -> std::string {
            if constexpr (std::is_same_v<T, std::string>) { return "\"" + v + "\""; }
            else if constexpr (std::is_same_v<T, bool>) { return v ? "true" : "false"; }
            else if constexpr (std::is_same_v<T, char16_t>) { return "u+" + std::to_string(static_cast<uint16_t>(v)); }
            else { return std::to_string(v); }
        }, value);
    }
} // namespace stridedb::record
