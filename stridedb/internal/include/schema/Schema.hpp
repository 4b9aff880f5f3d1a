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

// internal/include/schema/Schema.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stridedb::schema {
    /**
     * Field types. VarString can be declared but is rejected by LayoutBuilder.
     */
    enum class FieldType : uint8_t {
        Int32,
        Int64,
        Int16,
        Bool,
        Char16,
        FixedString,
        VarString
    };

    [[nodiscard]] const char* field_type_name(FieldType type) noexcept;

    /**
     * Returns the type named by name (e.g. "int32", "fixed_string"), or nullopt.
     */
    [[nodiscard]] std::optional<FieldType> parse_field_type(std::string_view name) noexcept;

    [[nodiscard]] constexpr bool is_integer_type(FieldType type) noexcept {
        return type == FieldType::Int16 || type == FieldType::Int32 || type == FieldType::Int64;
    }

    /**
     * Field attributes. Designed for designated initialisers:
     * `{.key = true}`, `{.indexed = true, .unique = true}`.
     */
    struct FieldAttrs {
        bool key = false; ///< Repository key; write-once after lock
        bool indexed = false; ///< Maintains a secondary value index
        bool unique = false; ///< Rejects duplicate values (requires indexed)
        bool sequence = false; ///< Sequence-generated integer
    };

    struct FieldDef {
        std::string name;
        FieldType type{FieldType::Int32};
        std::optional<uint32_t> max_length; ///< Required for FixedString
        FieldAttrs attrs;
    };

    /**
     * Schema - Static description of a fixed-shape record.
     *
     * Fields are kept in declaration order, which is also their byte order
     * in the encoded record. A Schema is only a description; it is checked
     * and turned into offsets by LayoutBuilder.
     *
     * Usage:
     * ```cpp
     * auto schema = Schema{"Order", 7}
     *     .add("id", FieldType::Int32, {.key = true})
     *     .add_fixed_string("code", 8, {.indexed = true, .unique = true})
     *     .set_transactional(true);
     * ```
     */
    class Schema {
        public:
            Schema() = default;

            explicit Schema(std::string name, int16_t type_id = 0, int16_t group_id = 0)
                : name_{std::move(name)}, type_id_{type_id}, group_id_{group_id} {}

            Schema& add(std::string name, FieldType type, FieldAttrs attrs = {}) {
                fields_.push_back(FieldDef{std::move(name), type, std::nullopt, attrs});
                return *this;
            }

            Schema& add_fixed_string(std::string name, uint32_t max_length, FieldAttrs attrs = {}) {
                fields_.push_back(FieldDef{std::move(name), FieldType::FixedString, max_length, attrs});
                return *this;
            }

            Schema& add(FieldDef def) {
                fields_.push_back(std::move(def));
                return *this;
            }

            Schema& set_transactional(bool value) noexcept {
                transactional_ = value;
                return *this;
            }

            Schema& set_repository_keyed(bool value) noexcept {
                repository_keyed_ = value;
                return *this;
            }

            [[nodiscard]] const std::string& name() const noexcept { return name_; }
            [[nodiscard]] int16_t type_id() const noexcept { return type_id_; }
            [[nodiscard]] int16_t group_id() const noexcept { return group_id_; }
            [[nodiscard]] bool transactional() const noexcept { return transactional_; }
            [[nodiscard]] bool repository_keyed() const noexcept { return repository_keyed_; }
            [[nodiscard]] const std::vector<FieldDef>& fields() const noexcept { return fields_; }

        private:
            std::string name_;
            int16_t type_id_{0};
            int16_t group_id_{0};
            bool transactional_{false};
            bool repository_keyed_{false};
            std::vector<FieldDef> fields_;
    };
} // namespace stridedb::schema
