#include "collab/ConceptLookup.h"

StaticConceptLookup::StaticConceptLookup()
    : entries_(defaultEntries()) {}

StaticConceptLookup::StaticConceptLookup(const QList<Entry> &entries)
    : entries_(entries) {}

QString StaticConceptLookup::lookup(const QString &query) const {
    const QString normalized = query.toLower().trimmed();
    for (const Entry &entry : entries_) {
        if (normalized.contains(entry.first)) {
            return entry.second;
        }
    }
    return fallbackAnswer();
}

QString StaticConceptLookup::fallbackAnswer() {
    return QStringLiteral("I could not find a direct match in the local concept cache. "
                          "Try asking about a narrower concept, such as ordering, grouping "
                          "or snapshot semantics.");
}

const QList<StaticConceptLookup::Entry> &StaticConceptLookup::defaultEntries() {
    static const QList<Entry> entries = {
        {"forward chaining",
         "Forward-chaining engines evaluate rules against current facts and fire each "
         "matching rule; conflict resolution decides order."},
        {"first-match-wins",
         "First-match-wins means pick one winning rule from a group after sorting by "
         "priority and tie-breakers, then ignore the rest of that group."},
        {"snapshot",
         "Snapshot/restore usually stores a deep copy of mutable state at a timestamp "
         "and restores that copy later."},
        {"restore",
         "Restore should replace current state from a stored snapshot, while leaving "
         "audit history untouched unless explicitly rolled back."},
        {"deepcopy",
         "deepcopy recursively copies nested containers so future mutations do not "
         "affect saved snapshots."},
        {"rule engine",
         "A rule engine evaluates a set of rules against input data. Each rule has a "
         "condition and an action; the engine checks conditions and fires the actions "
         "of matching rules, usually ordered by priority."},
        {"operator",
         "Comparison operators for conditions: eq, neq, gt, lt, gte, lte. Implement each "
         "as a callable taking (actual, expected) and returning a boolean."},
        {"compound condition",
         "Compound conditions combine simple conditions with AND and OR. AND needs all "
         "sub-conditions to hold, OR needs at least one; they nest as a tree."},
        {"priority",
         "Priority determines evaluation order: higher numbers are evaluated first, and "
         "ties are broken by a stable secondary key such as the name."},
        {"group",
         "Groups partition rules into named sets. Within a group the rules are sorted "
         "by priority and the first matching rule wins."},
        {"audit",
         "An audit trail records every evaluation: which rules were checked, which "
         "matched, which fired, the input and a timestamp."},
        {"evaluate",
         "Evaluation extracts the field from the input, applies the operator and "
         "compares with the expected value; compound conditions recurse."}
    };
    return entries;
}
