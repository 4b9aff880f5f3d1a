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

// internal/src/schema/Layout.cpp
#include "schema/Layout.hpp"

#include <limits>
#include <stdexcept>

namespace stridedb::schema {
    namespace {
        [[noreturn]] void fail(const Schema& schema, const std::string& what) {
            throw std::invalid_argument("Schema '" + schema.name() + "': " + what);
        }
    } // anonymous namespace

    // ==================== Layout ====================

    std::optional<size_t> Layout::field_id(std::string_view name) const {
        if (const auto it = field_index_.find(std::string{name}); it != field_index_.end()) { return it->second; }
        return std::nullopt;
    }

    size_t Layout::require_field(std::string_view name) const {
        if (const auto id = field_id(name)) { return *id; }
        throw std::invalid_argument("Layout '" + name_ + "': unknown field '" + std::string{name} + "'");
    }

    // ==================== LayoutBuilder ====================

    size_t LayoutBuilder::byte_length(FieldType type, std::optional<uint32_t> max_length) {
        switch (type) {
            case FieldType::Int32: return 4;
            case FieldType::Int64: return 8;
            case FieldType::Int16: return 2;
            case FieldType::Bool: return 1;
            case FieldType::Char16: return 2;
            case FieldType::FixedString:
                if (!max_length || *max_length == 0) { throw std::invalid_argument("FixedString requires a positive max_length"); }
                return *max_length;
            case FieldType::VarString:
                throw std::invalid_argument("Variable length strings are not supported");
        }
        throw std::invalid_argument("Unknown field type");
    }

    std::shared_ptr<const Layout> LayoutBuilder::build(const Schema& schema) {
        std::shared_ptr<Layout> layout{new Layout{}};
        layout->name_ = schema.name();
        layout->type_id_ = schema.type_id();
        layout->group_id_ = schema.group_id();
        layout->transactional_ = schema.transactional();
        layout->repository_keyed_ = schema.repository_keyed();

        size_t offset = Layout::HEADER_SIZE;

        for (const auto& def : schema.fields()) {
            if (def.name.empty()) { fail(schema, "field name must not be empty"); }
            if (layout->field_index_.contains(def.name)) { fail(schema, "duplicate field '" + def.name + "'"); }

            if (def.type == FieldType::VarString) { fail(schema, "field '" + def.name + "': variable length strings are not supported"); }
            if (def.type == FieldType::FixedString && (!def.max_length || *def.max_length == 0)) {
                fail(schema, "field '" + def.name + "': fixed_string requires a positive max_length");
            }

            if (def.attrs.key) {
                if (layout->key_field_) { fail(schema, "more than one key field ('" + layout->fields_[*layout->key_field_].name + "', '" + def.name + "')"); }
                layout->key_field_ = layout->fields_.size();
            }

            if (def.attrs.sequence) {
                if (!is_integer_type(def.type)) { fail(schema, "field '" + def.name + "': sequence fields must be int16, int32 or int64"); }
                if (def.attrs.indexed) { fail(schema, "field '" + def.name + "': sequence fields cannot be indexed"); }
            }

            if (def.attrs.unique && !def.attrs.indexed) { fail(schema, "field '" + def.name + "': unique requires indexed"); }

            const size_t length = byte_length(def.type, def.max_length);
            if (def.attrs.indexed) { layout->indexed_fields_.push_back(layout->fields_.size()); }

            layout->field_index_.emplace(def.name, layout->fields_.size());
            layout->fields_.push_back(FieldLayout{def.name, def.type, offset, length, def.attrs});
            offset += length;
        }

        if (schema.repository_keyed()) {
            if (!layout->key_field_) { fail(schema, "repository schemas must have exactly one key field"); }
            if (!is_integer_type(layout->fields_[*layout->key_field_].type)) { fail(schema, "repository key must be an integer field"); }
        }

        // body_length is an int32 on the wire
        if (offset > static_cast<size_t>(std::numeric_limits<int32_t>::max())) { fail(schema, "record too large"); }

        layout->stride_ = offset;
        return layout;
    }
} // namespace stridedb::schema
