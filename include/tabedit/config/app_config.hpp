#pragma once

#include <optional>
#include <string>

namespace tabedit {

struct AppConfig {
    std::optional<std::string> model_file;
    std::optional<std::string> script_file;
    std::optional<std::string> log_file;
    bool json_output = false;
    bool verbose = false;
    bool debug = false;          // -vv
    bool quiet = false;
    bool formula_fixup = true;
};

} // namespace tabedit
