#pragma once

#include <tabedit/core/result.hpp>
#include <tabedit/core/types.hpp>
#include <tabedit/formula/tokenizer.hpp>
#include <tabedit/model/model.hpp>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace tabedit {

enum class SiteRole {
    Table,   // 'Sales' or the Sales in Sales[Amount]
    Member,  // [Amount]
};

// One resolved occurrence of a reference in an expression.
struct ReferenceSite {
    ObjectId target;
    SiteRole role = SiteRole::Member;
    Span span;
    TokenKind token_kind = TokenKind::BracketedReference;
    // Table qualifier of a member site, when the reference was written T[X].
    std::optional<Span> qualifier;
    std::optional<TokenKind> qualifier_kind;
};

struct UnresolvedReference {
    Span span;
    std::string text;
};

struct ExpressionEntry {
    std::string text;
    std::vector<Token> tokens;
    std::vector<ReferenceSite> sites;
    std::vector<UnresolvedReference> unresolved;
    std::optional<Error> parse_error;
};

// ---------------------------------------------------------------------------
// DependencyIndex — reference edges from formula-bearing nodes to the nodes
// their expressions name.
//
// An entry is rebuilt in full whenever its expression text changes, so it is
// never partially stale. Names are resolved case-insensitively against the
// model as it is at indexing time; only ids are stored. Cycles are allowed.
// ---------------------------------------------------------------------------
class DependencyIndex {
public:
    explicit DependencyIndex(const ITokenizer& tokenizer);

    DependencyIndex(const DependencyIndex&) = delete;
    DependencyIndex& operator=(const DependencyIndex&) = delete;

    // -- Maintenance --------------------------------------------------------

    void OnExpressionChanged(const Model& model, ObjectId node,
                             std::string_view old_text, std::string_view new_text);

    // A node was inserted; resolves its own expression and anything that may
    // now resolve to it.
    void OnNodeAdded(const Model& model, ObjectId id);

    // Name or parent of a node changed.
    void OnNodeChanged(const Model& model, ObjectId id);

    // A node was erased from the model; its dependents are re-resolved.
    void OnNodeRemoved(const Model& model, ObjectId id);

    // Re-resolves every expression that holds an unresolved reference.
    void RefreshUnresolved(const Model& model);

    void Rebuild(const Model& model);
    void Clear();

    // -- Queries ------------------------------------------------------------

    [[nodiscard]] std::set<ObjectId> GetDependents(ObjectId id) const;
    [[nodiscard]] std::set<ObjectId> GetDependencies(ObjectId id) const;

    // Transitive closure of dependents, ordered by id, excluding `id` itself.
    [[nodiscard]] std::vector<ObjectId> GetDependentsTransitive(ObjectId id) const;

    [[nodiscard]] const ExpressionEntry* Entry(ObjectId id) const;

    // Sites in `dependent` whose target is `target`, in text order.
    [[nodiscard]] std::vector<ReferenceSite> SitesReferencing(ObjectId dependent,
                                                              ObjectId target) const;

    // Entries that failed to tokenize and whose text contains `name`,
    // compared case-insensitively.
    [[nodiscard]] std::vector<ObjectId> UnparsedMentioning(std::string_view name) const;

    [[nodiscard]] std::size_t EntryCount() const noexcept { return entries_.size(); }

private:
    void Index(const Model& model, ObjectId id, std::string_view text);
    void Reindex(const Model& model, ObjectId id);
    void Unlink(ObjectId id);
    void ReindexMentioning(const Model& model, std::string_view name);

    const ITokenizer& tokenizer_;
    std::map<ObjectId, ExpressionEntry> entries_;
    std::map<ObjectId, std::set<ObjectId>> dependents_;
};

} // namespace tabedit
