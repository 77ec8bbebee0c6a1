#pragma once
#include "../core/errors.hpp"
#include "../core/sample.hpp"
#include "csv_reader.hpp"
#include "recording_schema.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <fstream>
#include <istream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Parse a numeric CSV field
 * @return nullopt unless the whole token is a finite number
 */
inline std::optional<double> parse_number(const std::string& token) {
    if (token.empty()) return std::nullopt;
    try {
        std::size_t pos = 0;
        double d = std::stod(token, &pos);
        if (pos != token.size() || !std::isfinite(d)) return std::nullopt;
        return d;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

/**
 * @brief Load a recording from delimited text
 *
 * The first content line is the header; the schema resolves which header
 * columns carry which fields. Samples come back stable-sorted by timestamp,
 * so rows sharing a timestamp keep their source order.
 *
 * @param in Input stream positioned at the start of the text
 * @param schema Field to column mapping and recording kind
 * @param source_name Identifier used in the recording and in error messages
 * @param delimiter Field delimiter
 * @throws MalformedRecordingError on missing required columns, field count
 *         mismatch or unparsable numeric fields
 * @throws EmptyRecordingError when there is no header or no data row
 */
inline Recording load_recording(std::istream& in, const RecordingSchema& schema,
                                const std::string& source_name, char delimiter = ',') {
    CsvReader reader(in, delimiter);

    std::vector<std::string> header;
    bool well_formed = true;
    if (!reader.read_header(header, well_formed)) {
        throw EmptyRecordingError(source_name);
    }
    if (!well_formed) {
        throw MalformedRecordingError(source_name, "line " + std::to_string(reader.line_number()) +
                                      ": unterminated quote in header");
    }

    // Resolve header positions of every mapped field
    std::vector<std::pair<Field, std::size_t>> layout;
    for (const auto& [field, name] : schema.columns) {
        if (name.empty()) continue;
        auto it = std::find(header.begin(), header.end(), name);
        if (it == header.end()) {
            if (schema.is_required(field)) {
                throw MalformedRecordingError(source_name, "missing required column '" + name +
                                              "' for " + field_to_string(field));
            }
            continue;
        }
        layout.emplace_back(field, static_cast<std::size_t>(it - header.begin()));
    }
    std::sort(layout.begin(), layout.end(),
              [](const auto& a, const auto& b) { return a.second < b.second; });

    Recording rec;
    rec.name = source_name;
    rec.kind = schema.kind;
    for (const auto& [field, index] : layout) {
        rec.columns.emplace_back(field, header[index]);
    }

    std::vector<std::string> fields;
    while (reader.next_row(fields, well_formed)) {
        const std::string where = "line " + std::to_string(reader.line_number());
        if (!well_formed) {
            throw MalformedRecordingError(source_name, where + ": unterminated quote");
        }
        if (fields.size() != header.size()) {
            throw MalformedRecordingError(source_name, where + ": expected " +
                                          std::to_string(header.size()) + " fields, got " +
                                          std::to_string(fields.size()));
        }

        Sample s;
        double mag[3] = {0.0, 0.0, 0.0};
        double pos[2] = {0.0, 0.0};
        bool has_mag = false, has_pos = false;

        for (const auto& [field, index] : layout) {
            const std::string& token = fields[index];
            if (token.empty() && !schema.is_required(field)) continue;

            auto value = parse_number(token);
            if (!value) {
                throw MalformedRecordingError(source_name, where + ": column '" + header[index] +
                                              "' is not a number: '" + token + "'");
            }
            double v = *value;
            switch (field) {
                case Field::TIMESTAMP: s.t = v; break;
                case Field::MAG_X: mag[0] = v; has_mag = true; break;
                case Field::MAG_Y: mag[1] = v; has_mag = true; break;
                case Field::MAG_Z: mag[2] = v; has_mag = true; break;
                case Field::X: pos[0] = v; has_pos = true; break;
                case Field::Y: pos[1] = v; has_pos = true; break;
                case Field::ACCURACY: s.accuracy = v; break;
                case Field::FLOOR:
                case Field::TYPE:
                    if (v != std::floor(v) ||
                        v < static_cast<double>(std::numeric_limits<int>::min()) ||
                        v > static_cast<double>(std::numeric_limits<int>::max())) {
                        throw MalformedRecordingError(source_name, where + ": column '" +
                                                      header[index] + "' must be an integer, got '" +
                                                      token + "'");
                    }
                    if (field == Field::FLOOR) s.floor = static_cast<int>(v);
                    else s.type = static_cast<int>(v);
                    break;
            }
        }
        if (has_mag) s.field = MagneticField{mag[0], mag[1], mag[2]};
        if (has_pos) s.position = PlanarPoint{pos[0], pos[1]};
        rec.samples.push_back(s);
    }

    if (rec.samples.empty()) {
        throw EmptyRecordingError(source_name);
    }

    std::stable_sort(rec.samples.begin(), rec.samples.end(),
                     [](const Sample& a, const Sample& b) { return a.t < b.t; });
    return rec;
}

/**
 * @brief Load a recording from a file
 * @throws RecordingIoError if the file cannot be opened
 */
inline Recording load_recording(const std::string& path, const RecordingSchema& schema,
                                char delimiter = ',') {
    std::ifstream f(path);
    if (!f) {
        throw RecordingIoError(path, "cannot open recording");
    }
    return load_recording(f, schema, path, delimiter);
}
