#pragma once

#include <tabedit/core/result.hpp>
#include <tabedit/core/types.hpp>
#include <tabedit/formula/dependency_index.hpp>
#include <tabedit/formula/tokenizer.hpp>
#include <tabedit/model/model.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tabedit {

struct FixupOptions {
    bool enabled = true;
};

// Progress of the most recent rename or move.
enum class FixupStage {
    Validating,
    Applying,
    Indexing,
    Rewriting,
    Committed,
    Rejected,
};

[[nodiscard]] const char* FixupStageName(FixupStage stage);

enum class FixupChangeKind {
    Rename,
    Move,
};

struct FixupChange {
    FixupChangeKind kind = FixupChangeKind::Rename;
    ObjectId target;
    std::string old_name;
    std::string new_name;
    ObjectId old_table;   // Move only
    ObjectId new_table;   // Move only
};

// Rewrite of one dependent expression. When `error` is set the expression is
// left as it is and the error is flagged on the node instead.
struct PlannedRewrite {
    ObjectId dependent;
    std::string old_text;
    std::string new_text;
    std::size_t spans = 0;
    std::optional<std::string> error;
};

struct FixupReport {
    std::vector<ObjectId> rewritten;
    std::vector<ObjectId> flagged;
    std::size_t spans_replaced = 0;
};

// ---------------------------------------------------------------------------
// IExpressionWriter — sink for fixup results. Writes go through the normal
// recorded expression path of the owner, so they join the open transaction.
// ---------------------------------------------------------------------------
class IExpressionWriter {
public:
    virtual ~IExpressionWriter() = default;

    [[nodiscard]] virtual Result<void, Error> WriteExpression(ObjectId id,
                                                              const std::string& text) = 0;
    [[nodiscard]] virtual Result<void, Error> FlagExpressionError(ObjectId id,
                                                                  const std::string& message) = 0;
};

// ---------------------------------------------------------------------------
// FixupEngine — rewrites formula references after a rename or move.
//
// Plan() reads the reference sites the index recorded for the last
// tokenization of each dependent, so it must run after the model write but
// before the index is refreshed for the changed node. Dependents are visited
// in ascending id order; within one expression, spans are replaced from the
// highest offset down. String literals and comments are never sites and are
// never touched.
// ---------------------------------------------------------------------------
class FixupEngine {
public:
    FixupEngine(const DependencyIndex& index, const ITokenizer& tokenizer,
                FixupOptions options = {});

    [[nodiscard]] const FixupOptions& Options() const noexcept { return options_; }
    void SetOptions(FixupOptions options) { options_ = options; }

    // Empty when fixups are disabled.
    [[nodiscard]] std::vector<PlannedRewrite> Plan(const Model& model,
                                                   const FixupChange& change) const;

    [[nodiscard]] Result<FixupReport, Error> Apply(const std::vector<PlannedRewrite>& plan,
                                                   IExpressionWriter& writer) const;

private:
    const DependencyIndex& index_;
    const ITokenizer& tokenizer_;
    FixupOptions options_;
};

} // namespace tabedit
