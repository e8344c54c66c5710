#pragma once

#include <tabedit/undo/action.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tabedit {

enum class UndoState {
    Idle,
    Recording,
    Undoing,
    Redoing,
};

[[nodiscard]] const char* UndoStateName(UndoState state);

// ---------------------------------------------------------------------------
// UndoManager — transaction history with nestable batches.
//
// Batches nest by depth; only the outermost EndBatch commits. Misuse
// (unbalanced EndBatch, recording during replay, undo with an open batch)
// throws std::logic_error.
// ---------------------------------------------------------------------------
class UndoManager {
public:
    UndoManager() = default;

    UndoManager(const UndoManager&) = delete;
    UndoManager& operator=(const UndoManager&) = delete;

    void BeginBatch(const std::string& label);
    void EndBatch();

    // Records one action. Outside a batch it becomes its own transaction
    // labelled with the action description.
    void Add(Action action);

    // Returns false when there is nothing to undo/redo.
    bool Undo(IActionTarget& target);
    bool Redo(IActionTarget& target);

    void Clear();

    [[nodiscard]] bool CanUndo() const noexcept { return !undo_stack_.empty(); }
    [[nodiscard]] bool CanRedo() const noexcept { return !redo_stack_.empty(); }
    [[nodiscard]] std::size_t UndoDepth() const noexcept { return undo_stack_.size(); }
    [[nodiscard]] std::size_t RedoDepth() const noexcept { return redo_stack_.size(); }
    [[nodiscard]] int BatchDepth() const noexcept { return depth_; }
    [[nodiscard]] UndoState State() const noexcept { return state_; }
    [[nodiscard]] bool IsReplaying() const noexcept {
        return state_ == UndoState::Undoing || state_ == UndoState::Redoing;
    }

    // Most recent first.
    [[nodiscard]] std::vector<std::string> UndoLabels() const;
    [[nodiscard]] std::vector<std::string> RedoLabels() const;

    [[nodiscard]] const std::vector<Transaction>& UndoStack() const noexcept { return undo_stack_; }
    [[nodiscard]] const std::vector<Transaction>& RedoStack() const noexcept { return redo_stack_; }

private:
    void Commit(Transaction transaction);

    UndoState state_ = UndoState::Idle;
    int depth_ = 0;
    std::optional<Transaction> pending_;
    std::vector<Transaction> undo_stack_;
    std::vector<Transaction> redo_stack_;
};

// ---------------------------------------------------------------------------
// BatchScope — RAII guard pairing BeginBatch with EndBatch.
// ---------------------------------------------------------------------------
class BatchScope {
public:
    BatchScope(UndoManager& manager, const std::string& label);
    ~BatchScope();

    BatchScope(const BatchScope&) = delete;
    BatchScope& operator=(const BatchScope&) = delete;
    BatchScope(BatchScope&& other) noexcept;
    BatchScope& operator=(BatchScope&&) = delete;

private:
    UndoManager* manager_;
    int depth_ = 0;
};

} // namespace tabedit
