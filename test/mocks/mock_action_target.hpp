#pragma once

#include <tabedit/undo/action.hpp>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace tabedit::testing {

// ---------------------------------------------------------------------------
// MockActionTarget — hand-written IActionTarget that records the replay
// order. Set fail_on_call to make the n-th apply (1-based) throw.
// ---------------------------------------------------------------------------
class MockActionTarget : public IActionTarget {
public:
    struct CallRecord {
        bool forward;
        Action action;
    };

    void ApplyForward(const Action& action) override { Record(true, action); }
    void ApplyInverse(const Action& action) override { Record(false, action); }

    [[nodiscard]] const std::vector<CallRecord>& Calls() const noexcept { return calls_; }

    [[nodiscard]] std::vector<std::string> Descriptions() const {
        std::vector<std::string> out;
        for (const auto& c : calls_) {
            out.push_back((c.forward ? "+" : "-") + DescribeAction(c.action));
        }
        return out;
    }

    void Reset() { calls_.clear(); }

    std::size_t fail_on_call = 0;

private:
    void Record(bool forward, const Action& action) {
        calls_.push_back({forward, action});
        if (fail_on_call != 0 && calls_.size() == fail_on_call) {
            throw std::logic_error("MockActionTarget: injected failure");
        }
    }

    std::vector<CallRecord> calls_;
};

// Property change of a measure expression, for building transactions.
inline Action SetExpr(std::uint64_t id, const std::string& from, const std::string& to) {
    return PropertySetAction{ObjectId(id), Property::Expression, from, to};
}

} // namespace tabedit::testing
