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

// internal/src/schema/Schema.cpp
#include "schema/Schema.hpp"

#include <array>
#include <utility>

namespace stridedb::schema {
    namespace {
        constexpr std::array<std::pair<std::string_view, FieldType>, 7> TYPE_NAMES{{
            {"int32", FieldType::Int32},
            {"int64", FieldType::Int64},
            {"int16", FieldType::Int16},
            {"bool", FieldType::Bool},
            {"char16", FieldType::Char16},
            {"fixed_string", FieldType::FixedString},
            {"var_string", FieldType::VarString},
        }};
    } // anonymous namespace

    const char* field_type_name(FieldType type) noexcept {
        for (const auto& [name, t] : TYPE_NAMES) {
            if (t == type) { return name.data(); }
        }
        return "unknown";
    }

    std::optional<FieldType> parse_field_type(std::string_view name) noexcept {
        for (const auto& [n, t] : TYPE_NAMES) {
            if (n == name) { return t; }
        }
        return std::nullopt;
    }
} // namespace stridedb::schema
