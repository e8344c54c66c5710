#include <tabedit/cli/output_formatter.hpp>

#include <algorithm>
#include <iomanip>

namespace tabedit {

void OutputFormatter::PrintTable(
    const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows) const {
    if (json_mode_) {
        auto arr = nlohmann::json::array();
        for (const auto& row : rows) {
            nlohmann::json obj = nlohmann::json::object();
            for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
                obj[headers[c]] = row[c];
            }
            arr.push_back(std::move(obj));
        }
        out_ << arr.dump() << "\n";
        return;
    }

    // Plain human-readable table: compute column widths.
    std::vector<size_t> widths(headers.size(), 0);
    for (size_t c = 0; c < headers.size(); ++c) {
        widths[c] = headers[c].size();
    }
    for (const auto& row : rows) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    for (size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) out_ << "  ";
        out_ << std::left << std::setw(static_cast<int>(widths[c])) << headers[c];
    }
    out_ << "\n";

    for (size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) out_ << "  ";
        out_ << std::string(widths[c], '-');
    }
    out_ << "\n";

    for (const auto& row : rows) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            if (c > 0) out_ << "  ";
            out_ << std::left << std::setw(static_cast<int>(widths[c])) << row[c];
        }
        out_ << "\n";
    }
}

void OutputFormatter::PrintDetail(const std::string& title,
                                  const std::vector<DetailSection>& sections) const {
    out_ << title << "\n";

    // Index of the last non-empty section, which closes the tree.
    size_t last = sections.size();
    for (size_t i = 0; i < sections.size(); ++i) {
        if (!sections[i].entries.empty() || !sections[i].title.empty()) {
            last = i;
        }
    }

    for (size_t si = 0; si < sections.size(); ++si) {
        const auto& sec = sections[si];
        const bool last_section = si == last;
        if (sec.title.empty()) {
            for (size_t ei = 0; ei < sec.entries.size(); ++ei) {
                const bool last_entry = last_section && ei + 1 == sec.entries.size();
                out_ << (last_entry ? "+-- " : "|-- ") << sec.entries[ei].first << ": "
                     << sec.entries[ei].second << "\n";
            }
            continue;
        }
        out_ << (last_section ? "+-- " : "|-- ") << sec.title << "\n";
        const char* indent = last_section ? "    " : "|   ";
        if (sec.entries.empty()) {
            out_ << indent << "+-- (none)\n";
        }
        for (size_t ei = 0; ei < sec.entries.size(); ++ei) {
            out_ << indent << (ei + 1 == sec.entries.size() ? "+-- " : "|-- ")
                 << sec.entries[ei].first;
            if (!sec.entries[ei].second.empty()) {
                out_ << ": " << sec.entries[ei].second;
            }
            out_ << "\n";
        }
    }
}

void OutputFormatter::PrintJson(const nlohmann::json& json) const {
    out_ << json.dump(2) << "\n";
}

void OutputFormatter::PrintError(const Error& error) const {
    if (json_mode_) {
        err_ << error.ToJson() << "\n";
        return;
    }

    err_ << "Error: " << error.operation << " (" << error.CategoryName() << ")\n";
    if (!error.target.empty()) {
        err_ << "  Object: " << error.target << "\n";
    }
    err_ << "  " << error.message << "\n";
}

void OutputFormatter::PrintSuccess(const std::string& message) const {
    if (json_mode_) {
        nlohmann::json j;
        j["success"] = true;
        j["message"] = message;
        out_ << j.dump() << "\n";
        return;
    }
    if (quiet_) {
        return;
    }
    out_ << message << "\n";
}

} // namespace tabedit
