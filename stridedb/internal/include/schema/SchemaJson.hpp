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

// internal/include/schema/SchemaJson.hpp
#pragma once

#include "Schema.hpp"
#include <filesystem>
#include <string_view>
#include <nlohmann/json_fwd.hpp>

namespace stridedb::schema {
    /**
     * JSON schema definitions.
     *
     * Format:
     * ```json
     * {
     *   "name": "Order", "type_id": 7, "group_id": 1,
     *   "transactional": true, "repository_keyed": true,
     *   "fields": [
     *     {"name": "id",   "type": "int32", "key": true},
     *     {"name": "code", "type": "fixed_string", "max_length": 8, "indexed": true, "unique": true}
     *   ]
     * }
     * ```
     *
     * Missing booleans default to false, missing ids to 0. Only the shape of
     * the document is checked here; LayoutBuilder validates the schema itself.
     */

    /**
     * @throws std::invalid_argument on a malformed document
     */
    [[nodiscard]] Schema schema_from_json(const nlohmann::json& j);

    [[nodiscard]] nlohmann::json schema_to_json(const Schema& schema);

    /**
     * Parses a JSON document held in a string.
     *
     * @throws std::invalid_argument on a parse error or malformed document
     */
    [[nodiscard]] Schema parse_schema(std::string_view text);

    /**
     * Reads and parses a JSON schema file.
     *
     * @throws std::runtime_error if the file cannot be opened
     * @throws std::invalid_argument on a parse error or malformed document
     */
    [[nodiscard]] Schema load_schema_file(const std::filesystem::path& path);
} // namespace stridedb::schema
