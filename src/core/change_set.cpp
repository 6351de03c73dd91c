#include "jdelta/change_set.hpp"

#include "jdelta/json_equality.hpp"

namespace jdelta {

void ChangeSet::push(const Change& change) {
    switch (change.kind) {
    case ChangeKind::Added:
        added_.append(change);
        break;
    case ChangeKind::Removed:
        removed_.append(change);
        break;
    case ChangeKind::Modified:
        modified_.append(change);
        break;
    }
}

bool ChangeSet::isEmpty() const {
    return added_.isEmpty() && removed_.isEmpty() && modified_.isEmpty();
}

qsizetype ChangeSet::size() const {
    return added_.size() + removed_.size() + modified_.size();
}

QVector<Change> ChangeSet::allChanges() const {
    QVector<Change> out;
    out.reserve(size());
    out.append(added_);
    out.append(removed_);
    out.append(modified_);
    return out;
}

FilteredChanges ChangeSet::filteredChanges(const IgnoreFilter& filter) const {
    return FilteredChanges(*this, filter);
}

ChangeSet ChangeSet::filterIgnorePatterns(const IgnoreFilter& filter) const {
    ChangeSet out;
    out.after_ = after_;
    for (const Change& change : filteredChanges(filter)) {
        out.push(change);
    }
    return out;
}

QJsonObject ChangeSet::summary() const {
    return {
        {"added", static_cast<double>(added_.size())},
        {"removed", static_cast<double>(removed_.size())},
        {"modified", static_cast<double>(modified_.size())},
        {"total", static_cast<double>(size())},
    };
}

bool ChangeSet::operator==(const ChangeSet& other) const {
    return added_ == other.added_ && removed_ == other.removed_ && modified_ == other.modified_ &&
           jsonEquals(after_, other.after_);
}

FilteredChanges::FilteredChanges(const ChangeSet& changes, const IgnoreFilter& filter)
    : changes_(&changes), filter_(&filter) {}

const QVector<Change>& FilteredChanges::category(const ChangeSet& changes, int index) {
    switch (index) {
    case 0:
        return changes.added();
    case 1:
        return changes.removed();
    default:
        return changes.modified();
    }
}

qsizetype FilteredChanges::count() const {
    qsizetype n = 0;
    for (auto it = begin(); it != end(); ++it) {
        ++n;
    }
    return n;
}

QVector<Change> FilteredChanges::toVector() const {
    QVector<Change> out;
    for (const Change& change : *this) {
        out.append(change);
    }
    return out;
}

FilteredChanges::const_iterator::const_iterator(
    const ChangeSet* changes,
    const IgnoreFilter* filter,
    int category,
    qsizetype index)
    : changes_(changes), filter_(filter), category_(category), index_(index) {
    skipIgnored();
}

FilteredChanges::const_iterator::reference FilteredChanges::const_iterator::operator*() const {
    return category(*changes_, category_).at(index_);
}

FilteredChanges::const_iterator& FilteredChanges::const_iterator::operator++() {
    ++index_;
    skipIgnored();
    return *this;
}

FilteredChanges::const_iterator FilteredChanges::const_iterator::operator++(int) {
    const_iterator previous = *this;
    ++*this;
    return previous;
}

bool FilteredChanges::const_iterator::operator==(const const_iterator& other) const {
    return changes_ == other.changes_ && filter_ == other.filter_ && category_ == other.category_ &&
           index_ == other.index_;
}

// Moves forward to the next visible change, crossing into later categories as needed.
void FilteredChanges::const_iterator::skipIgnored() {
    if (changes_ == nullptr) {
        return;
    }
    while (category_ < kCategoryCount) {
        const QVector<Change>& changes = category(*changes_, category_);
        while (index_ < changes.size() && filter_->ignores(changes.at(index_))) {
            ++index_;
        }
        if (index_ < changes.size()) {
            return;
        }
        ++category_;
        index_ = 0;
    }
}

}  // namespace jdelta
