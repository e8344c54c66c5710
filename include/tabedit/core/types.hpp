#pragma once

#include <tabedit/core/result.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace tabedit {

// ---------------------------------------------------------------------------
// ObjectId — stable internal identity of a model object.
//
// Assigned once at creation and never reused within a model. Id 0 is the
// invalid id; the model root always has id 1.
// ---------------------------------------------------------------------------
class ObjectId {
public:
    constexpr ObjectId() noexcept = default;
    explicit constexpr ObjectId(std::uint64_t value) noexcept : value_(value) {}

    [[nodiscard]] constexpr std::uint64_t Value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool IsValid() const noexcept { return value_ != 0; }

    constexpr bool operator==(const ObjectId& other) const noexcept { return value_ == other.value_; }
    constexpr bool operator!=(const ObjectId& other) const noexcept { return value_ != other.value_; }
    constexpr bool operator<(const ObjectId& other) const noexcept { return value_ < other.value_; }

    [[nodiscard]] std::string ToString() const { return "#" + std::to_string(value_); }

private:
    std::uint64_t value_ = 0;
};

// ---------------------------------------------------------------------------
// ObjectName — validated object display name.
//
// Rules:
//   - Non-empty, max 128 characters
//   - No control characters
//   - No leading or trailing whitespace
// ---------------------------------------------------------------------------
class ObjectName {
public:
    static constexpr std::size_t kMaxLength = 128;

    static Result<ObjectName, std::string> Create(std::string_view name);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const ObjectName& other) const { return value_ == other.value_; }
    bool operator!=(const ObjectName& other) const { return value_ != other.value_; }

    ObjectName(const ObjectName&) = default;
    ObjectName& operator=(const ObjectName&) = default;
    ObjectName(ObjectName&&) noexcept = default;
    ObjectName& operator=(ObjectName&&) noexcept = default;

private:
    explicit ObjectName(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// Case-insensitive (ASCII) name comparison, used for uniqueness checks and
// reference resolution.
[[nodiscard]] bool NamesEqual(std::string_view a, std::string_view b) noexcept;

// Lower-cased copy of a name, used as a lookup key.
[[nodiscard]] std::string FoldName(std::string_view name);

} // namespace tabedit

namespace std {

template <>
struct hash<tabedit::ObjectId> {
    size_t operator()(const tabedit::ObjectId& id) const noexcept {
        return hash<uint64_t>{}(id.Value());
    }
};

template <>
struct hash<tabedit::ObjectName> {
    size_t operator()(const tabedit::ObjectName& n) const noexcept {
        return hash<string>{}(n.Value());
    }
};

} // namespace std
