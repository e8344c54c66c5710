#pragma once

#include <tabedit/core/result.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace tabedit {

// ---------------------------------------------------------------------------
// DetailSection — a titled group of key/value pairs for PrintDetail.
// An empty title puts the entries at the root of the tree.
// ---------------------------------------------------------------------------
struct DetailSection {
    std::string title;
    std::vector<std::pair<std::string, std::string>> entries;
};

// ---------------------------------------------------------------------------
// OutputFormatter — human-readable and JSON output for CLI commands.
// ---------------------------------------------------------------------------
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode, bool quiet = false,
                             std::ostream& out = std::cout,
                             std::ostream& err = std::cerr)
        : json_mode_(json_mode), quiet_(quiet), out_(out), err_(err) {}

    [[nodiscard]] bool IsJsonMode() const noexcept { return json_mode_; }

    // In JSON mode, outputs a JSON array of objects keyed by header.
    void PrintTable(const std::vector<std::string>& headers,
                    const std::vector<std::vector<std::string>>& rows) const;

    // Tree-style key/value listing (human-readable mode only).
    void PrintDetail(const std::string& title,
                     const std::vector<DetailSection>& sections) const;

    void PrintJson(const nlohmann::json& json) const;

    // Print an error to stderr.
    void PrintError(const Error& error) const;

    // Suppressed in quiet mode.
    void PrintSuccess(const std::string& message) const;

private:
    bool json_mode_;
    bool quiet_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace tabedit
