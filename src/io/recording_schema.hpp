#pragma once
#include "../core/errors.hpp"
#include "../core/sample.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Mapping from recorded fields to header column names
 *
 * The schema tells the loader which header column carries which field.
 * Required fields depend on the recording kind; every other mapped field is
 * optional and only used when the header has it.
 *
 * JSON form: {"timestamp": "t", "mag_x": "x", "mag_y": "y", "mag_z": "z"}
 */
struct RecordingSchema {
    RecordingKind kind{RecordingKind::MAGNETIC};
    std::map<Field, std::string> columns;

    /**
     * @brief Layout of the magnetics export of IPS recordings
     *
     * The exported CSV names the field components x, y, z.
     */
    static RecordingSchema magnetics_default() {
        RecordingSchema s;
        s.kind = RecordingKind::MAGNETIC;
        s.columns = {
            {Field::TIMESTAMP, "t"},
            {Field::MAG_X, "x"},
            {Field::MAG_Y, "y"},
            {Field::MAG_Z, "z"},
            {Field::ACCURACY, "accuracy"}
        };
        return s;
    }

    /**
     * @brief Layout of the ground-truth positions export
     */
    static RecordingSchema positions_default() {
        RecordingSchema s;
        s.kind = RecordingKind::POSITIONAL;
        s.columns = {
            {Field::TIMESTAMP, "t"},
            {Field::X, "x"},
            {Field::Y, "y"},
            {Field::FLOOR, "floor"},
            {Field::TYPE, "type"},
            {Field::ACCURACY, "accuracy"}
        };
        return s;
    }

    static std::vector<Field> required_fields(RecordingKind kind) {
        if (kind == RecordingKind::MAGNETIC) {
            return {Field::TIMESTAMP, Field::MAG_X, Field::MAG_Y, Field::MAG_Z};
        }
        return {Field::TIMESTAMP, Field::X, Field::Y};
    }

    bool is_required(Field f) const {
        for (Field r : required_fields(kind)) {
            if (r == f) return true;
        }
        return false;
    }

    /**
     * @brief Header name for a field, if mapped
     */
    std::optional<std::string> column_for(Field f) const {
        auto it = columns.find(f);
        if (it == columns.end() || it->second.empty()) return std::nullopt;
        return it->second;
    }

    /**
     * @brief Parse a field name as used in JSON ("timestamp", "mag_x", ...)
     */
    static std::optional<Field> field_from_string(const std::string& name) {
        static const Field all[] = {
            Field::TIMESTAMP, Field::MAG_X, Field::MAG_Y, Field::MAG_Z,
            Field::X, Field::Y, Field::FLOOR, Field::TYPE, Field::ACCURACY
        };
        for (Field f : all) {
            if (field_to_string(f) == name) return f;
        }
        return std::nullopt;
    }

    /**
     * @brief Build a schema from JSON, starting from the kind's default layout
     *
     * Keys override the default column names; an empty string unmaps a field.
     * Throws ConfigError on unknown fields, non-string names or a required
     * field left unmapped.
     */
    static RecordingSchema from_json(const nlohmann::json& j, RecordingKind kind) {
        RecordingSchema s = kind == RecordingKind::MAGNETIC ? magnetics_default()
                                                            : positions_default();
        if (j.is_null()) return s;
        if (!j.is_object()) {
            throw ConfigError("schema", "schema must be a JSON object");
        }
        for (auto it = j.begin(); it != j.end(); ++it) {
            auto field = field_from_string(it.key());
            if (!field) {
                throw ConfigError("schema." + it.key(), "unknown field");
            }
            if (!it.value().is_string()) {
                throw ConfigError("schema." + it.key(), "column name must be a string");
            }
            s.columns[*field] = it.value().get<std::string>();
        }
        for (Field r : required_fields(kind)) {
            if (!s.column_for(r)) {
                throw ConfigError("schema." + field_to_string(r), "required field is not mapped");
            }
        }
        return s;
    }

    nlohmann::json to_json() const {
        nlohmann::json j = nlohmann::json::object();
        for (const auto& [field, name] : columns) {
            j[field_to_string(field)] = name;
        }
        return j;
    }
};
