#include <tabedit/session/fixup_engine.hpp>

#include <tabedit/core/log.hpp>
#include <tabedit/formula/reference_text.hpp>

#include <algorithm>
#include <utility>

namespace tabedit {

namespace {

struct Edit {
    Span span;
    std::string replacement;
};

std::string TableText(TokenKind written_as, const std::string& name) {
    if (written_as == TokenKind::Identifier && IsPlainIdentifier(name)) {
        return name;
    }
    return QuoteTable(name);
}

// Replacement for an unqualified [Name] member site. A measure is written
// T[Name] when a column of the dependent's own table would otherwise capture
// the new name.
std::string MemberText(const Model& model, ObjectId dependent, const FixupChange& change) {
    const Node* target = model.Find(change.target);
    if (target == nullptr || target->Kind() != NodeKind::Measure) {
        return QuoteMember(change.new_name);
    }
    auto owner = model.TableOf(dependent);
    if (!owner || !model.FindColumn(*owner, change.new_name)) {
        return QuoteMember(change.new_name);
    }
    const Node* table = model.Find(target->parent);
    if (table == nullptr) {
        return QuoteMember(change.new_name);
    }
    return QuoteTable(table->name) + QuoteMember(change.new_name);
}

std::vector<Edit> EditsFor(const Model& model, ObjectId dependent, const FixupChange& change,
                           const std::vector<ReferenceSite>& sites) {
    std::vector<Edit> edits;
    if (change.kind == FixupChangeKind::Rename) {
        for (const auto& site : sites) {
            if (site.role == SiteRole::Table) {
                edits.push_back({site.span, TableText(site.token_kind, change.new_name)});
            } else if (site.qualifier) {
                edits.push_back({site.span, QuoteMember(change.new_name)});
            } else {
                edits.push_back({site.span, MemberText(model, dependent, change)});
            }
        }
        return edits;
    }

    // Move: only the table qualifier of T[M] changes; [M] stays as written.
    const Node* table = model.Find(change.new_table);
    if (table == nullptr) {
        return edits;
    }
    for (const auto& site : sites) {
        if (site.role == SiteRole::Member && site.qualifier) {
            edits.push_back({*site.qualifier,
                             TableText(site.qualifier_kind.value_or(TokenKind::Identifier),
                                       table->name)});
        }
    }
    return edits;
}

} // anonymous namespace

const char* FixupStageName(FixupStage stage) {
    switch (stage) {
        case FixupStage::Validating: return "Validating";
        case FixupStage::Applying:   return "Applying";
        case FixupStage::Indexing:   return "Indexing";
        case FixupStage::Rewriting:  return "Rewriting";
        case FixupStage::Committed:  return "Committed";
        case FixupStage::Rejected:   return "Rejected";
    }
    return "Unknown";
}

FixupEngine::FixupEngine(const DependencyIndex& index, const ITokenizer& tokenizer,
                         FixupOptions options)
    : index_(index), tokenizer_(tokenizer), options_(options) {}

std::vector<PlannedRewrite> FixupEngine::Plan(const Model& model,
                                              const FixupChange& change) const {
    std::vector<PlannedRewrite> plan;
    if (!options_.enabled) {
        return plan;
    }

    for (auto dependent : index_.GetDependents(change.target)) {
        const Node* node = model.Find(dependent);
        const std::string* text = node != nullptr ? ExpressionOf(*node) : nullptr;
        if (text == nullptr) {
            continue;
        }

        PlannedRewrite rewrite;
        rewrite.dependent = dependent;
        rewrite.old_text = *text;
        rewrite.new_text = *text;

        auto fresh = tokenizer_.Tokenize(*text);
        if (fresh.IsErr()) {
            rewrite.error = "Reference fixup failed: " + fresh.Error().message;
            plan.push_back(std::move(rewrite));
            continue;
        }
        const auto* entry = index_.Entry(dependent);
        if (entry == nullptr || entry->text != *text || entry->tokens != fresh.Value()) {
            rewrite.error = std::string("Reference fixup failed: expression changed since it was indexed");
            plan.push_back(std::move(rewrite));
            continue;
        }

        auto edits = EditsFor(model, dependent, change, index_.SitesReferencing(dependent, change.target));
        std::sort(edits.begin(), edits.end(), [](const Edit& a, const Edit& b) {
            return a.span.start > b.span.start;
        });
        edits.erase(std::unique(edits.begin(), edits.end(),
                                [](const Edit& a, const Edit& b) { return a.span == b.span; }),
                    edits.end());
        if (edits.empty()) {
            continue;
        }

        for (const auto& edit : edits) {
            rewrite.new_text.replace(edit.span.start, edit.span.Length(), edit.replacement);
        }
        rewrite.spans = edits.size();

        auto check = tokenizer_.Tokenize(rewrite.new_text);
        if (check.IsErr()) {
            rewrite.error = "Reference fixup failed: " + check.Error().message;
            rewrite.new_text = rewrite.old_text;
            rewrite.spans = 0;
        }
        plan.push_back(std::move(rewrite));
    }

    // Expressions that never tokenized hold no edges; flag those naming the
    // renamed object so the stale reference is visible.
    if (change.kind == FixupChangeKind::Rename) {
        for (auto id : index_.UnparsedMentioning(change.old_name)) {
            if (id == change.target) {
                continue;
            }
            const auto* entry = index_.Entry(id);
            PlannedRewrite rewrite;
            rewrite.dependent = id;
            rewrite.old_text = entry->text;
            rewrite.new_text = entry->text;
            rewrite.error = "Reference fixup failed: " + entry->parse_error->message;
            plan.push_back(std::move(rewrite));
        }
        std::stable_sort(plan.begin(), plan.end(),
                         [](const PlannedRewrite& a, const PlannedRewrite& b) {
                             return a.dependent < b.dependent;
                         });
    }
    return plan;
}

Result<FixupReport, Error> FixupEngine::Apply(const std::vector<PlannedRewrite>& plan,
                                              IExpressionWriter& writer) const {
    FixupReport report;
    for (const auto& rewrite : plan) {
        if (rewrite.error) {
            LogWarn("fixup", rewrite.dependent.ToString() + ": " + *rewrite.error);
            auto flagged = writer.FlagExpressionError(rewrite.dependent, *rewrite.error);
            if (flagged.IsErr()) {
                return Result<FixupReport, Error>::Err(std::move(flagged).Error());
            }
            report.flagged.push_back(rewrite.dependent);
            continue;
        }
        LogDebug("fixup", rewrite.dependent.ToString() + ": '" + rewrite.old_text +
                              "' -> '" + rewrite.new_text + "'");
        auto written = writer.WriteExpression(rewrite.dependent, rewrite.new_text);
        if (written.IsErr()) {
            return Result<FixupReport, Error>::Err(std::move(written).Error());
        }
        report.rewritten.push_back(rewrite.dependent);
        report.spans_replaced += rewrite.spans;
    }
    return Result<FixupReport, Error>::Ok(std::move(report));
}

} // namespace tabedit
