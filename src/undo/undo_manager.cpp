#include <tabedit/undo/undo_manager.hpp>

#include <tabedit/core/log.hpp>

#include <stdexcept>
#include <utility>

namespace tabedit {

namespace {

// Sets the manager state for the duration of a replay and restores it on
// every exit path.
class StateRestorer {
public:
    StateRestorer(UndoState& state, UndoState during) : state_(state), saved_(state) {
        state_ = during;
    }
    ~StateRestorer() { state_ = saved_; }

    StateRestorer(const StateRestorer&) = delete;
    StateRestorer& operator=(const StateRestorer&) = delete;

private:
    UndoState& state_;
    UndoState saved_;
};

std::vector<std::string> Labels(const std::vector<Transaction>& stack) {
    std::vector<std::string> labels;
    labels.reserve(stack.size());
    for (auto it = stack.rbegin(); it != stack.rend(); ++it) {
        labels.push_back(it->label);
    }
    return labels;
}

} // anonymous namespace

const char* UndoStateName(UndoState state) {
    switch (state) {
        case UndoState::Idle:      return "Idle";
        case UndoState::Recording: return "Recording";
        case UndoState::Undoing:   return "Undoing";
        case UndoState::Redoing:   return "Redoing";
    }
    return "Unknown";
}

// ---------------------------------------------------------------------------
// Recording
// ---------------------------------------------------------------------------
void UndoManager::BeginBatch(const std::string& label) {
    if (IsReplaying()) {
        throw std::logic_error("BeginBatch called during " +
                               std::string(UndoStateName(state_)));
    }
    if (depth_++ == 0) {
        pending_ = Transaction{label, {}};
        state_ = UndoState::Recording;
    }
}

void UndoManager::EndBatch() {
    if (depth_ == 0) {
        throw std::logic_error("EndBatch called without a matching BeginBatch");
    }
    if (--depth_ > 0) {
        return;
    }
    state_ = UndoState::Idle;
    Transaction transaction = std::move(*pending_);
    pending_.reset();
    if (transaction.actions.empty()) {
        LogDebug("undo", "Discarding empty transaction '" + transaction.label + "'");
        return;
    }
    Commit(std::move(transaction));
}

void UndoManager::Add(Action action) {
    if (IsReplaying()) {
        throw std::logic_error("Action recorded during " +
                               std::string(UndoStateName(state_)) + ": " +
                               DescribeAction(action));
    }
    redo_stack_.clear();
    if (pending_) {
        pending_->actions.push_back(std::move(action));
        return;
    }
    auto label = DescribeAction(action);
    Commit(Transaction{std::move(label), {std::move(action)}});
}

void UndoManager::Commit(Transaction transaction) {
    LogDebug("undo", "Committed '" + transaction.label + "' with " +
                         std::to_string(transaction.actions.size()) + " action(s)");
    undo_stack_.push_back(std::move(transaction));
    redo_stack_.clear();
}

// ---------------------------------------------------------------------------
// Replay
// ---------------------------------------------------------------------------
bool UndoManager::Undo(IActionTarget& target) {
    if (depth_ > 0) {
        throw std::logic_error("Undo called while a batch is open");
    }
    if (IsReplaying()) {
        throw std::logic_error("Undo called during " + std::string(UndoStateName(state_)));
    }
    if (undo_stack_.empty()) {
        return false;
    }
    {
        StateRestorer guard(state_, UndoState::Undoing);
        const auto& actions = undo_stack_.back().actions;
        for (auto it = actions.rbegin(); it != actions.rend(); ++it) {
            target.ApplyInverse(*it);
        }
    }
    LogDebug("undo", "Undid '" + undo_stack_.back().label + "'");
    redo_stack_.push_back(std::move(undo_stack_.back()));
    undo_stack_.pop_back();
    return true;
}

bool UndoManager::Redo(IActionTarget& target) {
    if (depth_ > 0) {
        throw std::logic_error("Redo called while a batch is open");
    }
    if (IsReplaying()) {
        throw std::logic_error("Redo called during " + std::string(UndoStateName(state_)));
    }
    if (redo_stack_.empty()) {
        return false;
    }
    {
        StateRestorer guard(state_, UndoState::Redoing);
        for (const auto& action : redo_stack_.back().actions) {
            target.ApplyForward(action);
        }
    }
    LogDebug("undo", "Redid '" + redo_stack_.back().label + "'");
    undo_stack_.push_back(std::move(redo_stack_.back()));
    redo_stack_.pop_back();
    return true;
}

void UndoManager::Clear() {
    undo_stack_.clear();
    redo_stack_.clear();
}

std::vector<std::string> UndoManager::UndoLabels() const {
    return Labels(undo_stack_);
}

std::vector<std::string> UndoManager::RedoLabels() const {
    return Labels(redo_stack_);
}

// ---------------------------------------------------------------------------
// BatchScope
// ---------------------------------------------------------------------------
BatchScope::BatchScope(UndoManager& manager, const std::string& label)
    : manager_(&manager) {
    manager_->BeginBatch(label);
    depth_ = manager_->BatchDepth();
}

// A batch already closed by an unbalanced EndBatch is left alone, so an
// enclosing batch is never ended from here.
BatchScope::~BatchScope() {
    if (manager_ != nullptr && manager_->BatchDepth() >= depth_) {
        manager_->EndBatch();
    }
}

BatchScope::BatchScope(BatchScope&& other) noexcept
    : manager_(other.manager_), depth_(other.depth_) {
    other.manager_ = nullptr;
}

} // namespace tabedit
