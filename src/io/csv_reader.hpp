#pragma once
#include <cctype>
#include <cstddef>
#include <istream>
#include <string>
#include <vector>

/**
 * @brief Line-oriented reader for delimited text with a header row
 *
 * Handles CRLF line endings, blank lines, '#' comment lines and
 * double-quoted fields ("" inside quotes is a literal quote). Quoted fields
 * cannot span lines.
 */
class CsvReader {
private:
    std::istream& in_;
    char delimiter_;
    std::size_t line_number_{0};

    bool next_content_line(std::string& line) {
        while (std::getline(in_, line)) {
            ++line_number_;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            std::string probe = line;
            trim_inplace(probe);
            if (probe.empty() || probe.front() == '#') continue;
            return true;
        }
        return false;
    }

public:
    explicit CsvReader(std::istream& in, char delimiter = ',')
        : in_(in), delimiter_(delimiter) {}

    /**
     * @brief Strip leading and trailing whitespace
     */
    static void trim_inplace(std::string& s) {
        auto b = s.begin(), e = s.end();
        while (b != e && std::isspace(static_cast<unsigned char>(*b))) ++b;
        while (e != b && std::isspace(static_cast<unsigned char>(*(e - 1)))) --e;
        s.assign(b, e);
    }

    /**
     * @brief Split one line into trimmed fields
     * @return false if a quoted field is not terminated
     */
    static bool split(const std::string& line, char delimiter, std::vector<std::string>& out) {
        out.clear();
        std::string field;
        bool in_quotes = false;
        bool was_quoted = false;

        for (std::size_t i = 0; i < line.size(); ++i) {
            char c = line[i];
            if (in_quotes) {
                if (c == '"') {
                    if (i + 1 < line.size() && line[i + 1] == '"') {
                        field.push_back('"');
                        ++i;
                    } else {
                        in_quotes = false;
                    }
                } else {
                    field.push_back(c);
                }
            } else if (c == '"' && !was_quoted) {
                std::string probe = field;
                trim_inplace(probe);
                if (probe.empty()) {
                    field.clear();
                    in_quotes = true;
                    was_quoted = true;
                } else {
                    field.push_back(c);  // quote inside an unquoted field is literal
                }
            } else if (c == delimiter) {
                if (!was_quoted) trim_inplace(field);
                out.push_back(field);
                field.clear();
                was_quoted = false;
            } else if (was_quoted && std::isspace(static_cast<unsigned char>(c))) {
                // whitespace after a closing quote
            } else {
                field.push_back(c);
            }
        }
        if (in_quotes) return false;
        if (!was_quoted) trim_inplace(field);
        out.push_back(field);
        return true;
    }

    /**
     * @brief Read the header row (first content line)
     * @return false if the stream holds no content line
     */
    bool read_header(std::vector<std::string>& header, bool& well_formed) {
        std::string line;
        if (!next_content_line(line)) return false;
        well_formed = split(line, delimiter_, header);
        return true;
    }

    /**
     * @brief Read the next data row
     * @return false at end of input
     */
    bool next_row(std::vector<std::string>& fields, bool& well_formed) {
        std::string line;
        if (!next_content_line(line)) return false;
        well_formed = split(line, delimiter_, fields);
        return true;
    }

    /**
     * @brief 1-based number of the line most recently read
     */
    std::size_t line_number() const { return line_number_; }

    char delimiter() const { return delimiter_; }
};
