#include <tabedit/core/types.hpp>

#include <algorithm>

namespace tabedit {

namespace {

bool IsControl(char c) {
    return static_cast<unsigned char>(c) < 0x20 || c == 0x7f;
}

bool IsSpace(char c) {
    return c == ' ' || c == '\t';
}

char LowerAscii(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ObjectName
// ---------------------------------------------------------------------------
Result<ObjectName, std::string> ObjectName::Create(std::string_view name) {
    if (name.empty()) {
        return Result<ObjectName, std::string>::Err("Name must not be empty");
    }
    if (name.size() > kMaxLength) {
        return Result<ObjectName, std::string>::Err(
            "Name must be at most " + std::to_string(kMaxLength) +
            " characters, got " + std::to_string(name.size()));
    }
    if (std::any_of(name.begin(), name.end(), IsControl)) {
        return Result<ObjectName, std::string>::Err(
            "Name must not contain control characters");
    }
    if (IsSpace(name.front()) || IsSpace(name.back())) {
        return Result<ObjectName, std::string>::Err(
            "Name must not start or end with whitespace");
    }
    return Result<ObjectName, std::string>::Ok(ObjectName(std::string(name)));
}

// ---------------------------------------------------------------------------
// Name folding
// ---------------------------------------------------------------------------
bool NamesEqual(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (LowerAscii(a[i]) != LowerAscii(b[i])) {
            return false;
        }
    }
    return true;
}

std::string FoldName(std::string_view name) {
    std::string folded(name);
    std::transform(folded.begin(), folded.end(), folded.begin(), LowerAscii);
    return folded;
}

} // namespace tabedit
