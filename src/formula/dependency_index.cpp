#include <tabedit/formula/dependency_index.hpp>

#include <tabedit/core/log.hpp>
#include <tabedit/formula/reference_text.hpp>

#include <deque>

namespace tabedit {

namespace {

bool IsTableToken(TokenKind kind) {
    return kind == TokenKind::Identifier || kind == TokenKind::QuotedQualifiedReference;
}

std::string TableNameOf(const Token& token, std::string_view text) {
    auto raw = token.span.Of(text);
    return token.kind == TokenKind::QuotedQualifiedReference ? UnquoteTable(raw)
                                                            : std::string(raw);
}

// True when `tokens[i]` is a table qualifier written directly before a
// bracketed member, as in Sales[Amount] or 'Sales'[Amount].
bool IsQualifier(const std::vector<Token>& tokens, std::size_t i) {
    return IsTableToken(tokens[i].kind) && i + 1 < tokens.size() &&
           tokens[i + 1].kind == TokenKind::BracketedReference &&
           tokens[i + 1].span.start == tokens[i].span.end;
}

} // anonymous namespace

DependencyIndex::DependencyIndex(const ITokenizer& tokenizer)
    : tokenizer_(tokenizer) {}

// ---------------------------------------------------------------------------
// Indexing
// ---------------------------------------------------------------------------
void DependencyIndex::Unlink(ObjectId id) {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return;
    }
    for (const auto& site : it->second.sites) {
        auto deps = dependents_.find(site.target);
        if (deps == dependents_.end()) {
            continue;
        }
        deps->second.erase(id);
        if (deps->second.empty()) {
            dependents_.erase(deps);
        }
    }
    entries_.erase(it);
}

void DependencyIndex::Index(const Model& model, ObjectId id, std::string_view text) {
    Unlink(id);

    ExpressionEntry entry;
    entry.text = std::string(text);

    auto tokenized = tokenizer_.Tokenize(text);
    if (tokenized.IsErr()) {
        LogWarn("index", "Cannot tokenize expression of " + model.PathOf(id) + ": " +
                             tokenized.Error().message);
        entry.parse_error = tokenized.Error();
        entries_.emplace(id, std::move(entry));
        return;
    }
    entry.tokens = std::move(tokenized).Value();

    const auto owner = model.TableOf(id);
    const auto& tokens = entry.tokens;

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const Token& token = tokens[i];

        if (IsQualifier(tokens, i)) {
            const Token& member = tokens[i + 1];
            const Span whole{token.span.start, member.span.end};
            auto table = model.FindTable(TableNameOf(token, text));
            if (!table) {
                entry.unresolved.push_back({whole, std::string(whole.Of(text))});
            } else {
                entry.sites.push_back(
                    {*table, SiteRole::Table, token.span, token.kind, std::nullopt, std::nullopt});
                auto member_name = UnquoteMember(member.span.Of(text));
                auto target = model.FindColumn(*table, member_name);
                if (!target) {
                    target = model.FindMeasureInTable(*table, member_name);
                }
                if (target) {
                    entry.sites.push_back({*target, SiteRole::Member, member.span,
                                           member.kind, token.span, token.kind});
                } else {
                    entry.unresolved.push_back(
                        {member.span, std::string(member.span.Of(text))});
                }
            }
            ++i;
            continue;
        }

        if (token.kind == TokenKind::BracketedReference) {
            auto name = UnquoteMember(token.span.Of(text));
            std::optional<ObjectId> target;
            if (owner) {
                target = model.FindColumn(*owner, name);
            }
            if (!target) {
                target = model.FindMeasure(name);
            }
            if (target) {
                entry.sites.push_back({*target, SiteRole::Member, token.span, token.kind,
                                       std::nullopt, std::nullopt});
            } else {
                entry.unresolved.push_back({token.span, std::string(token.span.Of(text))});
            }
        } else if (token.kind == TokenKind::QuotedQualifiedReference) {
            auto table = model.FindTable(TableNameOf(token, text));
            if (table) {
                entry.sites.push_back({*table, SiteRole::Table, token.span, token.kind,
                                       std::nullopt, std::nullopt});
            } else {
                entry.unresolved.push_back({token.span, std::string(token.span.Of(text))});
            }
        }
    }

    for (const auto& site : entry.sites) {
        dependents_[site.target].insert(id);
    }
    if (!entry.unresolved.empty()) {
        LogDebug("index", model.PathOf(id) + " has " +
                              std::to_string(entry.unresolved.size()) +
                              " unresolved reference(s)");
    }
    entries_.emplace(id, std::move(entry));
}

void DependencyIndex::Reindex(const Model& model, ObjectId id) {
    const Node* node = model.Find(id);
    const std::string* text = node != nullptr ? ExpressionOf(*node) : nullptr;
    if (text == nullptr) {
        Unlink(id);
        return;
    }
    Index(model, id, *text);
}

void DependencyIndex::ReindexMentioning(const Model& model, std::string_view name) {
    std::vector<ObjectId> hits;
    for (const auto& [id, entry] : entries_) {
        for (const auto& token : entry.tokens) {
            auto raw = token.span.Of(entry.text);
            bool mentions = false;
            switch (token.kind) {
                case TokenKind::BracketedReference:
                    mentions = NamesEqual(UnquoteMember(raw), name);
                    break;
                case TokenKind::QuotedQualifiedReference:
                    mentions = NamesEqual(UnquoteTable(raw), name);
                    break;
                case TokenKind::Identifier:
                    mentions = NamesEqual(raw, name);
                    break;
                default:
                    break;
            }
            if (mentions) {
                hits.push_back(id);
                break;
            }
        }
    }
    for (auto id : hits) {
        Reindex(model, id);
    }
}

// ---------------------------------------------------------------------------
// Maintenance
// ---------------------------------------------------------------------------
void DependencyIndex::OnExpressionChanged(const Model& model, ObjectId node,
                                          std::string_view old_text,
                                          std::string_view new_text) {
    LogDebug("index", "Expression of " + model.PathOf(node) + " changed from '" +
                          std::string(old_text) + "' to '" + std::string(new_text) + "'");
    Index(model, node, new_text);
}

void DependencyIndex::OnNodeAdded(const Model& model, ObjectId id) {
    const Node* node = model.Find(id);
    if (node == nullptr) {
        return;
    }
    if (IsFormulaBearing(*node)) {
        Reindex(model, id);
    }
    ReindexMentioning(model, node->name);
}

void DependencyIndex::OnNodeChanged(const Model& model, ObjectId id) {
    const Node* node = model.Find(id);
    if (node == nullptr) {
        return;
    }
    for (auto dependent : GetDependents(id)) {
        Reindex(model, dependent);
    }
    if (IsFormulaBearing(*node)) {
        Reindex(model, id);
    }
    ReindexMentioning(model, node->name);
    RefreshUnresolved(model);
}

void DependencyIndex::OnNodeRemoved(const Model& model, ObjectId id) {
    auto former = GetDependents(id);
    Unlink(id);
    dependents_.erase(id);
    for (auto dependent : former) {
        if (dependent != id) {
            Reindex(model, dependent);
        }
    }
}

void DependencyIndex::RefreshUnresolved(const Model& model) {
    std::vector<ObjectId> pending;
    for (const auto& [id, entry] : entries_) {
        if (!entry.unresolved.empty()) {
            pending.push_back(id);
        }
    }
    for (auto id : pending) {
        Reindex(model, id);
    }
}

void DependencyIndex::Rebuild(const Model& model) {
    Clear();
    for (auto kind : {NodeKind::CalculatedColumn, NodeKind::Measure}) {
        for (auto id : model.NodesOfKind(kind)) {
            Reindex(model, id);
        }
    }
    LogDebug("index", "Rebuilt " + std::to_string(entries_.size()) + " expression(s)");
}

void DependencyIndex::Clear() {
    entries_.clear();
    dependents_.clear();
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------
std::set<ObjectId> DependencyIndex::GetDependents(ObjectId id) const {
    auto it = dependents_.find(id);
    return it == dependents_.end() ? std::set<ObjectId>{} : it->second;
}

std::set<ObjectId> DependencyIndex::GetDependencies(ObjectId id) const {
    std::set<ObjectId> result;
    if (const auto* entry = Entry(id)) {
        for (const auto& site : entry->sites) {
            result.insert(site.target);
        }
    }
    return result;
}

std::vector<ObjectId> DependencyIndex::GetDependentsTransitive(ObjectId id) const {
    std::set<ObjectId> seen;
    std::deque<ObjectId> queue{id};
    while (!queue.empty()) {
        auto current = queue.front();
        queue.pop_front();
        for (auto dependent : GetDependents(current)) {
            if (dependent != id && seen.insert(dependent).second) {
                queue.push_back(dependent);
            }
        }
    }
    return {seen.begin(), seen.end()};
}

const ExpressionEntry* DependencyIndex::Entry(ObjectId id) const {
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : &it->second;
}

std::vector<ObjectId> DependencyIndex::UnparsedMentioning(std::string_view name) const {
    std::vector<ObjectId> result;
    const auto needle = FoldName(name);
    if (needle.empty()) {
        return result;
    }
    for (const auto& [id, entry] : entries_) {
        if (entry.parse_error && FoldName(entry.text).find(needle) != std::string::npos) {
            result.push_back(id);
        }
    }
    return result;
}

std::vector<ReferenceSite> DependencyIndex::SitesReferencing(ObjectId dependent,
                                                             ObjectId target) const {
    std::vector<ReferenceSite> result;
    if (const auto* entry = Entry(dependent)) {
        for (const auto& site : entry->sites) {
            if (site.target == target) {
                result.push_back(site);
            }
        }
    }
    return result;
}

} // namespace tabedit
