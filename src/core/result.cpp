#include <tabedit/core/result.hpp>

#include <iomanip>

namespace tabedit {

namespace {

// Object names may carry quotes, brackets and backslashes. core/ does not
// depend on nlohmann.
std::string JsonString(const std::string& s) {
    std::ostringstream out;
    out << '"';
    for (char c : s) {
        switch (c) {
            case '"':  out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n";  break;
            case '\r': out << "\\r";  break;
            case '\t': out << "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                        << static_cast<int>(static_cast<unsigned char>(c))
                        << std::dec;
                } else {
                    out << c;
                }
                break;
        }
    }
    out << '"';
    return out.str();
}

} // anonymous namespace

std::string Error::ToJson() const {
    std::ostringstream oss;
    oss << R"({"error":{)";
    oss << R"("category":)" << JsonString(CategoryName()) << ',';
    oss << R"("operation":)" << JsonString(operation) << ',';
    if (!target.empty()) {
        oss << R"("target":)" << JsonString(target) << ',';
    }
    oss << R"("message":)" << JsonString(message) << ',';
    oss << R"("exit_code":)" << ExitCode();
    oss << "}}";
    return oss.str();
}

} // namespace tabedit
