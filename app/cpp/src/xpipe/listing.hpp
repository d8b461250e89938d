#pragma once

#include <algorithm>
#include <array>
#include <boost/algorithm/string.hpp>
#include <boost/json.hpp>
#include <magic_enum.hpp>
#include <sstream>
#include <string>
#include <vector>

#include "api_client.hpp"
#include "errors.hpp"

namespace json = boost::json;

namespace xpipe {

enum class OutputFormat {
    TEXT,
    HTML,
    JSON,
    CSV,
    LATEX
};

enum class SortField {
    NAME,
    TYPE,
    CATEGORY,
    UUID
};

struct ListingOptions {
    OutputFormat format = OutputFormat::TEXT;
    SortField sort_by = SortField::NAME;
    bool reverse = false;
};

inline const std::array<std::string, 4> LISTING_COLUMNS = {"Name", "Type", "Category", "UUID"};
using ListingRow = std::array<std::string, 4>;

// Enum value from its name, any case
template <typename E>
E parse_choice(const std::string& option, const std::string& value) {
    const auto parsed = magic_enum::enum_cast<E>(boost::algorithm::to_upper_copy(value));
    if (!parsed.has_value()) {
        std::ostringstream oss;
        oss << "Invalid value for " << option << ": " << value << " (choose from";
        for (const auto& name : magic_enum::enum_names<E>()) {
            oss << " " << boost::algorithm::to_lower_copy(std::string(name));
        }
        oss << ")";
        throw UsageError(oss.str());
    }
    return parsed.value();
}

// One row per connection, in the order of LISTING_COLUMNS, sorted as requested
inline std::vector<ListingRow> listing_rows(const std::vector<Connection>& connections, const ListingOptions& options) {
    std::vector<ListingRow> rows;
    for (const auto& c : connections) {
        rows.push_back({boost::algorithm::join(c.name, "/"), c.type, boost::algorithm::join(c.category, ","), c.identifier});
    }
    const auto column = static_cast<std::size_t>(magic_enum::enum_integer(options.sort_by));
    std::stable_sort(rows.begin(), rows.end(), [&](const ListingRow& a, const ListingRow& b) {
        return options.reverse ? b[column] < a[column] : a[column] < b[column];
    });
    return rows;
}

namespace detail {
inline std::string text_table(const std::vector<ListingRow>& rows) {
    std::array<std::size_t, 4> widths;
    for (std::size_t i = 0; i < widths.size(); ++i) {
        widths[i] = LISTING_COLUMNS[i].size();
        for (const auto& row : rows) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }
    std::ostringstream out;
    auto separator = [&] {
        for (const auto width : widths) {
            out << '+' << std::string(width + 2, '-');
        }
        out << "+\n";
    };
    auto line = [&](const ListingRow& cells) {
        for (std::size_t i = 0; i < cells.size(); ++i) {
            out << "| " << cells[i] << std::string(widths[i] - cells[i].size() + 1, ' ');
        }
        out << "|\n";
    };
    separator();
    line(LISTING_COLUMNS);
    separator();
    for (const auto& row : rows) {
        line(row);
    }
    separator();
    return out.str();
}

inline std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) {
        return value;
    }
    return "\"" + boost::algorithm::replace_all_copy(value, "\"", "\"\"") + "\"";
}

inline std::string csv_table(const std::vector<ListingRow>& rows) {
    std::ostringstream out;
    auto line = [&](const ListingRow& cells) {
        for (std::size_t i = 0; i < cells.size(); ++i) {
            out << (i == 0 ? "" : ",") << csv_field(cells[i]);
        }
        out << "\r\n";
    };
    line(LISTING_COLUMNS);
    for (const auto& row : rows) {
        line(row);
    }
    return out.str();
}

inline std::string json_table(const std::vector<ListingRow>& rows) {
    json::array entries;
    for (const auto& row : rows) {
        json::object entry;
        for (std::size_t i = 0; i < row.size(); ++i) {
            entry[LISTING_COLUMNS[i]] = row[i];
        }
        entries.push_back(std::move(entry));
    }
    return json::serialize(entries) + "\n";
}

inline std::string html_escape(const std::string& value) {
    std::string escaped;
    for (const char c : value) {
        switch (c) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            default: escaped += c;
        }
    }
    return escaped;
}

inline std::string html_table(const std::vector<ListingRow>& rows) {
    std::ostringstream out;
    out << "<table>\n    <thead>\n        <tr>\n";
    for (const auto& column : LISTING_COLUMNS) {
        out << "            <th>" << html_escape(column) << "</th>\n";
    }
    out << "        </tr>\n    </thead>\n    <tbody>\n";
    for (const auto& row : rows) {
        out << "        <tr>\n";
        for (const auto& cell : row) {
            out << "            <td>" << html_escape(cell) << "</td>\n";
        }
        out << "        </tr>\n";
    }
    out << "    </tbody>\n</table>\n";
    return out.str();
}

inline std::string latex_escape(const std::string& value) {
    std::string escaped;
    for (const char c : value) {
        switch (c) {
            case '\\': escaped += "\\textbackslash{}"; break;
            case '~': escaped += "\\textasciitilde{}"; break;
            case '^': escaped += "\\textasciicircum{}"; break;
            case '&':
            case '%':
            case '$':
            case '#':
            case '_':
            case '{':
            case '}':
                escaped += '\\';
                escaped += c;
                break;
            default: escaped += c;
        }
    }
    return escaped;
}

inline std::string latex_table(const std::vector<ListingRow>& rows) {
    std::ostringstream out;
    auto line = [&](const ListingRow& cells) {
        for (std::size_t i = 0; i < cells.size(); ++i) {
            out << (i == 0 ? "" : " & ") << latex_escape(cells[i]);
        }
        out << " \\\\\n";
    };
    out << "\\begin{tabular}{llll}\n";
    line(LISTING_COLUMNS);
    for (const auto& row : rows) {
        line(row);
    }
    out << "\\end{tabular}\n";
    return out.str();
}
}  // namespace detail

inline std::string render_connections(const std::vector<Connection>& connections, const ListingOptions& options) {
    const auto rows = listing_rows(connections, options);
    switch (options.format) {
        case OutputFormat::TEXT:
            return detail::text_table(rows);
        case OutputFormat::HTML:
            return detail::html_table(rows);
        case OutputFormat::JSON:
            return detail::json_table(rows);
        case OutputFormat::CSV:
            return detail::csv_table(rows);
        case OutputFormat::LATEX:
            return detail::latex_table(rows);
    }
    throw std::invalid_argument("Unknown output format");
}
}  // namespace xpipe
