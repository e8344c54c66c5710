#pragma once

#include <tabedit/core/result.hpp>
#include <tabedit/core/types.hpp>
#include <tabedit/formula/dependency_index.hpp>
#include <tabedit/formula/tokenizer.hpp>
#include <tabedit/model/model.hpp>
#include <tabedit/session/fixup_engine.hpp>
#include <tabedit/undo/undo_manager.hpp>

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace tabedit {

struct SessionOptions {
    std::string model_name = "Model";
    bool formula_fixup = true;
};

// ---------------------------------------------------------------------------
// ModelSession — the editing surface of one model.
//
// Owns the object graph, the dependency index, the undo history and the
// fixup engine. Every successful edit is recorded; validation failures leave
// the model and the history untouched. Renames and moves rewrite dependent
// formulas inside the same transaction, so one Undo() reverts both.
//
// Single-threaded. Exceptions are reserved for misuse of the history
// (std::logic_error); expected failures are returned as Error.
// ---------------------------------------------------------------------------
class ModelSession : private IActionTarget, private IExpressionWriter {
public:
    explicit ModelSession(const ITokenizer& tokenizer, SessionOptions options = {});

    ModelSession(const ModelSession&) = delete;
    ModelSession& operator=(const ModelSession&) = delete;

    // -- History ------------------------------------------------------------

    void BeginBatch(const std::string& label);
    void EndBatch();
    bool Undo();
    bool Redo();

    // Empties the undo and redo history; the model is kept.
    void Clear();

    // -- Queries ------------------------------------------------------------

    [[nodiscard]] const Model& GetModel() const noexcept { return model_; }
    [[nodiscard]] const DependencyIndex& Index() const noexcept { return index_; }
    [[nodiscard]] const UndoManager& History() const noexcept { return history_; }

    [[nodiscard]] std::optional<ObjectId> Find(std::string_view path) const;
    [[nodiscard]] std::set<ObjectId> GetDependents(ObjectId id) const;
    [[nodiscard]] std::set<ObjectId> GetDependencies(ObjectId id) const;
    [[nodiscard]] std::vector<ObjectId> GetDependentsTransitive(ObjectId id) const;

    [[nodiscard]] FixupStage LastFixupStage() const noexcept { return last_stage_; }
    [[nodiscard]] const FixupReport& LastFixupReport() const noexcept { return last_report_; }

    [[nodiscard]] bool FormulaFixup() const noexcept { return fixup_.Options().enabled; }
    void SetFormulaFixup(bool enabled);

    // -- Creation -----------------------------------------------------------

    Result<ObjectId, Error> AddTable(const std::string& name);
    Result<ObjectId, Error> AddDataColumn(ObjectId table, const std::string& name,
                                          const std::string& data_type = "String",
                                          const std::string& source_column = "");
    Result<ObjectId, Error> AddCalculatedColumn(ObjectId table, const std::string& name,
                                                const std::string& expression,
                                                const std::string& data_type = "Variant");
    Result<ObjectId, Error> AddMeasure(ObjectId table, const std::string& name,
                                       const std::string& expression,
                                       const std::string& format_string = "");
    // An empty name is generated from the endpoints.
    Result<ObjectId, Error> AddRelationship(ObjectId from_column, ObjectId to_column,
                                            const std::string& name = "",
                                            bool is_active = true);
    Result<ObjectId, Error> AddHierarchy(ObjectId table, const std::string& name);
    Result<ObjectId, Error> AddPerspective(const std::string& name);
    Result<ObjectId, Error> AddRole(const std::string& name,
                                    const std::string& model_permission = "Read");
    Result<ObjectId, Error> AddAnnotation(ObjectId parent, const std::string& name,
                                          const std::string& value);

    // -- Edits --------------------------------------------------------------

    // Removes the node, its subtree and the relationships using any removed
    // column, as one transaction.
    Result<void, Error> RemoveNode(ObjectId id);

    Result<void, Error> Rename(ObjectId id, const std::string& name);
    Result<void, Error> Move(ObjectId id, ObjectId new_table);
    Result<void, Error> SetExpression(ObjectId id, const std::string& text);

    // Generic property write. Name, Parent and Expression are routed to
    // Rename, Move and SetExpression.
    Result<void, Error> SetProperty(ObjectId id, Property property, const PropertyValue& value);

private:
    // IActionTarget
    void ApplyForward(const Action& action) override;
    void ApplyInverse(const Action& action) override;

    // IExpressionWriter
    Result<void, Error> WriteExpression(ObjectId id, const std::string& text) override;
    Result<void, Error> FlagExpressionError(ObjectId id, const std::string& message) override;

    Result<ObjectId, Error> AddNode(Node node, const std::string& operation);
    Result<void, Error> RemoveOne(ObjectId id);
    Result<void, Error> Relocate(ObjectId id, Property property, const PropertyValue& value,
                                 const std::string& operation);

    // Writes through the model and records the change.
    Result<void, Error> SetAndRecord(ObjectId id, Property property,
                                     const PropertyValue& value, bool notify_index);

    void ReplayProperty(ObjectId id, Property property, const PropertyValue& expected,
                        const PropertyValue& value);
    void ReplayInsert(const Node& node);
    void ReplayErase(const Node& expected);
    void NotifyIndex(ObjectId id, Property property, const PropertyValue& old_value,
                     const PropertyValue& new_value);

    void RequireNotReplaying(const char* operation) const;

    SessionOptions options_;
    Model model_;
    DependencyIndex index_;
    UndoManager history_;
    FixupEngine fixup_;
    FixupStage last_stage_ = FixupStage::Committed;
    FixupReport last_report_;
};

} // namespace tabedit
