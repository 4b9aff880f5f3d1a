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

// internal/include/schema/Layout.hpp
#pragma once

#include "Schema.hpp"
#include "core/record/RecordHeader.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace stridedb::schema {
    /**
     * Placement of a single field inside an encoded record.
     */
    struct FieldLayout {
        std::string name;
        FieldType type;
        size_t offset; ///< Byte offset from the start of the record (header included)
        size_t length; ///< Encoded byte length
        FieldAttrs attrs;
    };

    /**
     * Layout - Immutable offset table for one Schema.
     *
     * Binary layout of a record:
     * [0..7]        RecordHeader (type_id, group_id, body_length)
     * [8..stride)   fields, packed in declaration order, no padding
     *
     * A Layout is created once by LayoutBuilder and shared (read-only) by
     * every RecordView and Repository of the Schema.
     *
     * Thread-safety: Immutable, fully thread-safe.
     */
    class Layout {
        public:
            static constexpr size_t HEADER_SIZE = core::RecordHeader::SIZE;

            /**
             * Total encoded length of one record, header included.
             */
            [[nodiscard]] size_t stride() const noexcept { return stride_; }

            [[nodiscard]] size_t field_count() const noexcept { return fields_.size(); }

            /**
             * @throws std::out_of_range if id >= field_count()
             */
            [[nodiscard]] const FieldLayout& field(size_t id) const { return fields_.at(id); }

            [[nodiscard]] const std::vector<FieldLayout>& fields() const noexcept { return fields_; }

            /**
             * Resolves a field name to its id, or nullopt if unknown.
             */
            [[nodiscard]] std::optional<size_t> field_id(std::string_view name) const;

            /**
             * Resolves a field name to its id.
             *
             * @throws std::invalid_argument if unknown
             */
            [[nodiscard]] size_t require_field(std::string_view name) const;

            [[nodiscard]] std::optional<size_t> key_field() const noexcept { return key_field_; }

            /**
             * Ids of all indexed fields, in declaration order.
             */
            [[nodiscard]] const std::vector<size_t>& indexed_fields() const noexcept { return indexed_fields_; }

            [[nodiscard]] const std::string& name() const noexcept { return name_; }
            [[nodiscard]] int16_t type_id() const noexcept { return type_id_; }
            [[nodiscard]] int16_t group_id() const noexcept { return group_id_; }
            [[nodiscard]] bool transactional() const noexcept { return transactional_; }
            [[nodiscard]] bool repository_keyed() const noexcept { return repository_keyed_; }

            /**
             * Every layout describes a fixed-length object.
             */
            [[nodiscard]] static constexpr bool fixed_length() noexcept { return true; }

            /**
             * Expected header for records of this layout.
             */
            [[nodiscard]] core::RecordHeader header() const noexcept {
                return core::RecordHeader{type_id_, group_id_, static_cast<int32_t>(stride_)};
            }

        private:
            friend class LayoutBuilder;
            Layout() = default;

            std::string name_;
            int16_t type_id_{0};
            int16_t group_id_{0};
            bool transactional_{false};
            bool repository_keyed_{false};
            size_t stride_{0};
            std::vector<FieldLayout> fields_;
            std::unordered_map<std::string, size_t> field_index_;
            std::vector<size_t> indexed_fields_;
            std::optional<size_t> key_field_;
    };

    /**
     * LayoutBuilder - Schema -> Layout.
     *
     * Deterministic and side-effect free: the same Schema always yields the
     * same offsets and stride.
     */
    class LayoutBuilder {
        public:
            /**
             * Validates the schema and computes its layout.
             *
             * @throws std::invalid_argument if the schema declares more than one
             *         key, no key while repository_keyed, a VarString field, a
             *         FixedString without a positive max length, a duplicate or
             *         empty field name, a non-integer or indexed sequence field,
             *         a unique field that is not indexed, or a non-integer key
             *         while repository_keyed.
             */
            [[nodiscard]] static std::shared_ptr<const Layout> build(const Schema& schema);

            /**
             * Encoded byte length of a field of the given type.
             *
             * @throws std::invalid_argument for VarString or a FixedString
             *         without a positive max length
             */
            [[nodiscard]] static size_t byte_length(FieldType type, std::optional<uint32_t> max_length);
    };
} // namespace stridedb::schema
