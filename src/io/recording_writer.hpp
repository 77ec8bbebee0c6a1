#pragma once
#include "../core/sample.hpp"
#include <charconv>
#include <ostream>
#include <string>
#include <vector>

/**
 * @brief Shortest text form of a double that parses back to the same value
 */
inline std::string format_number(double v) {
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), v);
    return std::string(buf, res.ptr);
}

namespace detail {

inline std::string quote_if_needed(const std::string& s, char delimiter) {
    if (s.find(delimiter) == std::string::npos && s.find('"') == std::string::npos) {
        return s;
    }
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

inline std::string field_text(const Sample& s, Field f) {
    switch (f) {
        case Field::TIMESTAMP: return format_number(s.t);
        case Field::MAG_X: return s.field ? format_number(s.field->mx) : "";
        case Field::MAG_Y: return s.field ? format_number(s.field->my) : "";
        case Field::MAG_Z: return s.field ? format_number(s.field->mz) : "";
        case Field::X: return s.position ? format_number(s.position->x) : "";
        case Field::Y: return s.position ? format_number(s.position->y) : "";
        case Field::FLOOR: return s.floor ? std::to_string(*s.floor) : "";
        case Field::TYPE: return s.type ? std::to_string(*s.type) : "";
        case Field::ACCURACY: return s.accuracy ? format_number(*s.accuracy) : "";
    }
    return "";
}

} // namespace detail

/**
 * @brief Write a recording back as delimited text
 *
 * Uses the columns the recording was loaded with, in source order. Samples
 * are written in the recording's (timestamp-sorted) order; absent optional
 * values become empty fields.
 */
inline void write_recording(std::ostream& out, const Recording& rec, char delimiter = ',') {
    for (std::size_t i = 0; i < rec.columns.size(); ++i) {
        if (i) out << delimiter;
        out << detail::quote_if_needed(rec.columns[i].second, delimiter);
    }
    out << '\n';
    for (const Sample& s : rec.samples) {
        for (std::size_t i = 0; i < rec.columns.size(); ++i) {
            if (i) out << delimiter;
            out << detail::field_text(s, rec.columns[i].first);
        }
        out << '\n';
    }
}

/**
 * @brief Write position estimates as "index,t,x,y"
 */
inline void write_estimates(std::ostream& out, const std::vector<PositionEstimate>& estimates) {
    out << "index,t,x,y\n";
    for (const auto& e : estimates) {
        out << e.sample_index << ',' << format_number(e.t) << ','
            << format_number(e.x) << ',' << format_number(e.y) << '\n';
    }
}
