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

// internal/src/schema/SchemaJson.cpp
#include "schema/SchemaJson.hpp"
#include "core/Logging.hpp"

#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <nlohmann/json.hpp>

namespace stridedb::schema {
    using json = nlohmann::json;

    namespace {
        int16_t read_id(const json& j, const char* key) {
            if (!j.contains(key)) { return 0; }
            if (!j[key].is_number_integer()) { throw std::invalid_argument(std::string{"schema: '"} + key + "' must be an integer"); }

            const auto value = j[key].get<int64_t>();
            if (value < std::numeric_limits<int16_t>::min() || value > std::numeric_limits<int16_t>::max()) {
                throw std::invalid_argument(std::string{"schema: '"} + key + "' out of int16 range");
            }
            return static_cast<int16_t>(value);
        }

        bool read_flag(const json& j, const char* key, const std::string& context) {
            if (!j.contains(key)) { return false; }
            if (!j[key].is_boolean()) { throw std::invalid_argument(context + ": '" + key + "' must be a boolean"); }
            return j[key].get<bool>();
        }

        FieldDef read_field(const json& f, size_t position) {
            const std::string context = "schema field #" + std::to_string(position);
            if (!f.is_object()) { throw std::invalid_argument(context + ": must be an object"); }
            if (!f.contains("name") || !f["name"].is_string()) { throw std::invalid_argument(context + ": missing 'name'"); }

            FieldDef def;
            def.name = f["name"].get<std::string>();
            const std::string field_context = "schema field '" + def.name + "'";

            if (!f.contains("type") || !f["type"].is_string()) { throw std::invalid_argument(field_context + ": missing 'type'"); }
            const auto type_name = f["type"].get<std::string>();
            const auto type = parse_field_type(type_name);
            if (!type) { throw std::invalid_argument(field_context + ": unknown type '" + type_name + "'"); }
            def.type = *type;

            if (f.contains("max_length")) {
                if (!f["max_length"].is_number_unsigned()) { throw std::invalid_argument(field_context + ": 'max_length' must be a non-negative integer"); }
                const auto max_length = f["max_length"].get<uint64_t>();
                if (max_length > std::numeric_limits<uint32_t>::max()) { throw std::invalid_argument(field_context + ": 'max_length' too large"); }
                def.max_length = static_cast<uint32_t>(max_length);
            }

            def.attrs.key = read_flag(f, "key", field_context);
            def.attrs.indexed = read_flag(f, "indexed", field_context);
            def.attrs.unique = read_flag(f, "unique", field_context);
            def.attrs.sequence = read_flag(f, "sequence", field_context);
            return def;
        }
    } // anonymous namespace

    Schema schema_from_json(const json& j) {
        if (!j.is_object()) { throw std::invalid_argument("schema: document must be an object"); }

        std::string name;
        if (j.contains("name")) {
            if (!j["name"].is_string()) { throw std::invalid_argument("schema: 'name' must be a string"); }
            name = j["name"].get<std::string>();
        }

        Schema schema{std::move(name), read_id(j, "type_id"), read_id(j, "group_id")};
        schema.set_transactional(read_flag(j, "transactional", "schema"));
        schema.set_repository_keyed(read_flag(j, "repository_keyed", "schema"));

        if (!j.contains("fields") || !j["fields"].is_array()) { throw std::invalid_argument("schema: 'fields' must be an array"); }

        size_t position = 0;
        for (const auto& f : j["fields"]) { schema.add(read_field(f, position++)); }

        return schema;
    }

    json schema_to_json(const Schema& schema) {
        json fields = json::array();

        for (const auto& def : schema.fields()) {
            json f = {
                {"name", def.name},
                {"type", field_type_name(def.type)}
            };

            if (def.max_length) { f["max_length"] = *def.max_length; }
            if (def.attrs.key) { f["key"] = true; }
            if (def.attrs.indexed) { f["indexed"] = true; }
            if (def.attrs.unique) { f["unique"] = true; }
            if (def.attrs.sequence) { f["sequence"] = true; }
            fields.push_back(std::move(f));
        }

        return json{
            {"name", schema.name()},
            {"type_id", schema.type_id()},
            {"group_id", schema.group_id()},
            {"transactional", schema.transactional()},
            {"repository_keyed", schema.repository_keyed()},
            {"fields", std::move(fields)}
        };
    }

    Schema parse_schema(std::string_view text) {
        json j;
        try { j = json::parse(text); }
        catch (const json::parse_error& e) { throw std::invalid_argument(std::string{"schema: invalid JSON: "} + e.what()); }

        return schema_from_json(j);
    }

    Schema load_schema_file(const std::filesystem::path& path) {
        std::ifstream file{path};
        if (!file) { throw std::runtime_error("Failed to open schema file: " + path.string()); }

        std::stringstream content;
        content << file.rdbuf();

        auto schema = parse_schema(content.str());
        STRIDEDB_LOG_INFO("schema", "loaded '", schema.name(), "' from ", path.string(), " (", schema.fields().size(), " fields)");
        return schema;
    }
} // namespace stridedb::schema
