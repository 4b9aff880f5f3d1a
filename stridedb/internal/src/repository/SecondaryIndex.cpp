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

// internal/src/repository/SecondaryIndex.cpp
#include "repository/SecondaryIndex.hpp"
#include "core/Logging.hpp"

namespace stridedb::repository {
    void SecondaryIndex::update(size_t offset, const record::FieldValue& value) {
        if (const auto it = reverse_.find(offset); it != reverse_.end() && it->second != value) {
            if (const auto bucket = forward_.find(it->second); bucket != forward_.end()) {
                bucket->second.erase(offset);
                if (bucket->second.empty()) { forward_.erase(bucket); }
            }
            STRIDEDB_LOG_DEBUG("index", "field ", field_id_, " offset ", offset, " moved ", record::to_string(it->second), " -> ",
                               record::to_string(value));
        }

        forward_[value].insert(offset);
        reverse_.insert_or_assign(offset, value);
        if (unique_field_) { unique_values_.insert(value); }
    }

    std::vector<size_t> SecondaryIndex::offsets_with_value(const record::FieldValue& value) const {
        const auto it = forward_.find(value);
        if (it == forward_.end()) { return {}; }
        return std::vector<size_t>{it->second.begin(), it->second.end()};
    }

    std::optional<record::FieldValue> SecondaryIndex::value_at(size_t offset) const {
        const auto it = reverse_.find(offset);
        if (it == reverse_.end()) { return std::nullopt; }
        return it->second;
    }
} // namespace stridedb::repository
