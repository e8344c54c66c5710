#include <tabedit/formula/reference_text.hpp>

namespace tabedit {

namespace {

std::string Quote(std::string_view name, char open, char close) {
    std::string out;
    out.reserve(name.size() + 2);
    out.push_back(open);
    for (char c : name) {
        out.push_back(c);
        if (c == close) {
            out.push_back(close);
        }
    }
    out.push_back(close);
    return out;
}

std::string Unquote(std::string_view token, char close) {
    if (token.size() < 2) {
        return std::string(token);
    }
    auto body = token.substr(1, token.size() - 2);
    std::string out;
    out.reserve(body.size());
    for (std::size_t i = 0; i < body.size(); ++i) {
        out.push_back(body[i]);
        if (body[i] == close && i + 1 < body.size() && body[i + 1] == close) {
            ++i;
        }
    }
    return out;
}

} // anonymous namespace

std::string QuoteMember(std::string_view name) {
    return Quote(name, '[', ']');
}

std::string QuoteTable(std::string_view name) {
    return Quote(name, '\'', '\'');
}

bool IsPlainIdentifier(std::string_view name) {
    if (name.empty()) {
        return false;
    }
    auto alpha = [](char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_';
    };
    if (!alpha(name.front())) {
        return false;
    }
    for (char c : name) {
        if (!alpha(c) && !(c >= '0' && c <= '9')) {
            return false;
        }
    }
    return true;
}

std::string UnquoteMember(std::string_view token) {
    return Unquote(token, ']');
}

std::string UnquoteTable(std::string_view token) {
    return Unquote(token, '\'');
}

} // namespace tabedit
