#ifndef LSYSTEM_RULE_TABLE_HPP
#define LSYSTEM_RULE_TABLE_HPP

#include <lsystem/turtle.hpp>
#include <algorithm>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lsystem {

/**
 * What a rewriter emits for a symbol that has no production rule.
 * Identity keeps the symbol; Drop removes it from the next generation.
 */
enum class UnmappedSymbolPolicy {
    Identity,
    Drop
};

/**
 * Production rules of an L-system.
 *
 * Each symbol may carry a production (the sequence replacing it in the next
 * generation) and, independently, a tag used by interpreters. The table is
 * filled through set/set_production/set_tag and then frozen behind a
 * RulesHandle, after which it is only read, from any number of threads.
 *
 * biggest_expansion() is kept exact under inserts and replacements through a
 * histogram of production lengths, so no call ever rescans the rules.
 */
template<typename Symbol, typename Tag = TurtleCommand>
class RuleTable {
public:
    using symbol_type = Symbol;
    using tag_type = Tag;
    using Production = std::vector<Symbol>;

private:
    struct Entry {
        std::optional<Production> production;
        std::optional<Tag> tag;
    };

    std::unordered_map<Symbol, Entry> entries_;

    // production length -> number of rules with that length
    std::map<std::size_t, std::size_t> length_histogram_;
    std::size_t rule_count_ = 0;
    UnmappedSymbolPolicy unmapped_policy_;

    void forget_length(std::size_t length) {
        auto it = length_histogram_.find(length);
        if (it != length_histogram_.end() && --it->second == 0) {
            length_histogram_.erase(it);
        }
    }

public:
    explicit RuleTable(UnmappedSymbolPolicy policy = UnmappedSymbolPolicy::Identity)
        : unmapped_policy_(policy) {}

    /**
     * Add or replace the production of a symbol.
     * Returns true if an existing production was replaced.
     */
    bool set_production(const Symbol& symbol, Production production) {
        auto& entry = entries_[symbol];
        bool replaced = entry.production.has_value();
        if (replaced) {
            forget_length(entry.production->size());
        } else {
            ++rule_count_;
        }
        ++length_histogram_[production.size()];
        entry.production = std::move(production);
        return replaced;
    }

    // Returns true if an existing tag was replaced
    bool set_tag(const Symbol& symbol, Tag tag) {
        auto& entry = entries_[symbol];
        bool replaced = entry.tag.has_value();
        entry.tag = std::move(tag);
        return replaced;
    }

    /**
     * Set both the production and the tag of a symbol.
     * Returns true if a production already existed for the symbol.
     */
    bool set(const Symbol& symbol, Production production, Tag tag) {
        set_tag(symbol, std::move(tag));
        return set_production(symbol, std::move(production));
    }

    // nullptr when the symbol has no production
    const Production* production(const Symbol& symbol) const {
        auto it = entries_.find(symbol);
        if (it == entries_.end() || !it->second.production) {
            return nullptr;
        }
        return &*it->second.production;
    }

    // nullptr when the symbol has no tag
    const Tag* tag(const Symbol& symbol) const {
        auto it = entries_.find(symbol);
        if (it == entries_.end() || !it->second.tag) {
            return nullptr;
        }
        return &*it->second.tag;
    }

    bool contains(const Symbol& symbol) const {
        return production(symbol) != nullptr;
    }

    // Longest production length, and never less than 1 (an unmapped symbol rewrites to one symbol)
    std::size_t biggest_expansion() const {
        if (length_histogram_.empty()) {
            return 1;
        }
        return std::max<std::size_t>(1, length_histogram_.rbegin()->first);
    }

    std::size_t rule_count() const { return rule_count_; }

    UnmappedSymbolPolicy unmapped_policy() const { return unmapped_policy_; }
};

/**
 * Read-only, reference-counted handle to a finished rule table.
 * Generations derived from the same axiom share one handle.
 */
template<typename Symbol, typename Tag = TurtleCommand>
using RulesHandle = std::shared_ptr<const RuleTable<Symbol, Tag>>;

// Freeze a rule table into a shareable handle
template<typename Symbol, typename Tag>
RulesHandle<Symbol, Tag> freeze(RuleTable<Symbol, Tag> rules) {
    return std::make_shared<const RuleTable<Symbol, Tag>>(std::move(rules));
}

} // namespace lsystem

#endif // LSYSTEM_RULE_TABLE_HPP
