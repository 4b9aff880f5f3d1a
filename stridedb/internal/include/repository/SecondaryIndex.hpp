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

// internal/include/repository/SecondaryIndex.hpp
#pragma once

#include "record/FieldValue.hpp"
#include <map>
#include <optional>
#include <set>
#include <unordered_map>
#include <vector>

namespace stridedb::repository {
    /**
     * SecondaryIndex - Value -> offsets index for one indexed field.
     *
     * Structures:
     * - forward_: value -> set of record offsets holding that value
     * - reverse_: offset -> last value written at that offset
     * - unique_:  values ever claimed on a unique field
     *
     * Invariants:
     * - every offset in reverse_ appears in exactly one forward_ bucket
     * - no empty buckets in forward_
     *
     * Values rebalanced away from an offset are NOT released from unique_;
     * a unique value stays claimed for the lifetime of the repository.
     *
     * Copyable: a copy is a full snapshot, used by repository transactions.
     */
    class SecondaryIndex {
        public:
            SecondaryIndex(size_t field_id, bool unique) noexcept : field_id_{field_id}, unique_field_{unique} {}

            [[nodiscard]] size_t field_id() const noexcept { return field_id_; }
            [[nodiscard]] bool unique() const noexcept { return unique_field_; }

            /**
             * Records that offset now holds value, evicting it from its old bucket.
             */
            void update(size_t offset, const record::FieldValue& value);

            /**
             * Offsets currently holding value, ascending. Empty if none.
             */
            [[nodiscard]] std::vector<size_t> offsets_with_value(const record::FieldValue& value) const;

            /**
             * True if value has not been claimed on this (unique) field.
             */
            [[nodiscard]] bool is_unique(const record::FieldValue& value) const { return !unique_values_.contains(value); }

            [[nodiscard]] std::optional<record::FieldValue> value_at(size_t offset) const;

            [[nodiscard]] size_t bucket_count() const noexcept { return forward_.size(); }
            [[nodiscard]] size_t entry_count() const noexcept { return reverse_.size(); }
            [[nodiscard]] size_t unique_value_count() const noexcept { return unique_values_.size(); }

            [[nodiscard]] bool operator==(const SecondaryIndex&) const = default;

        private:
            size_t field_id_;
            bool unique_field_;
            std::map<record::FieldValue, std::set<size_t>> forward_;
            std::unordered_map<size_t, record::FieldValue> reverse_;
            std::set<record::FieldValue> unique_values_;
    };
} // namespace stridedb::repository
