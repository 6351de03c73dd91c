#pragma once

#include <QJsonObject>
#include <QJsonValue>
#include <QVector>

#include <cstddef>
#include <iterator>

#include "jdelta/change.hpp"
#include "jdelta/ignore_filter.hpp"

namespace jdelta {

class FilteredChanges;

class ChangeSet {
public:
    ChangeSet() = default;

    void push(const Change& change);
    void setAfter(const QJsonValue& after) { after_ = after; }

    [[nodiscard]] const QVector<Change>& added() const { return added_; }
    [[nodiscard]] const QVector<Change>& removed() const { return removed_; }
    [[nodiscard]] const QVector<Change>& modified() const { return modified_; }
    [[nodiscard]] const QJsonValue& after() const { return after_; }

    [[nodiscard]] bool isEmpty() const;
    [[nodiscard]] qsizetype size() const;

    QVector<Change> allChanges() const;

    FilteredChanges filteredChanges(const IgnoreFilter& filter) const;

    ChangeSet filterIgnorePatterns(const IgnoreFilter& filter) const;

    QJsonObject summary() const;

    bool operator==(const ChangeSet& other) const;
    bool operator!=(const ChangeSet& other) const { return !(*this == other); }

private:
    QVector<Change> added_;
    QVector<Change> removed_;
    QVector<Change> modified_;
    QJsonValue after_;
};

class FilteredChanges {
public:
    // Points into the borrowed change set, so it stays valid after the view is gone.
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Change;
        using difference_type = std::ptrdiff_t;
        using pointer = const Change*;
        using reference = const Change&;

        const_iterator() = default;

        reference operator*() const;
        pointer operator->() const { return &**this; }
        const_iterator& operator++();
        const_iterator operator++(int);

        bool operator==(const const_iterator& other) const;
        bool operator!=(const const_iterator& other) const { return !(*this == other); }

    private:
        friend class FilteredChanges;

        const_iterator(const ChangeSet* changes, const IgnoreFilter* filter, int category, qsizetype index);
        void skipIgnored();

        const ChangeSet* changes_ = nullptr;
        const IgnoreFilter* filter_ = nullptr;
        int category_ = kCategoryCount;
        qsizetype index_ = 0;
    };

    FilteredChanges(const ChangeSet& changes, const IgnoreFilter& filter);

    const_iterator begin() const { return const_iterator(changes_, filter_, 0, 0); }
    const_iterator end() const { return const_iterator(changes_, filter_, kCategoryCount, 0); }

    qsizetype count() const;
    QVector<Change> toVector() const;

private:
    static constexpr int kCategoryCount = 3;

    static const QVector<Change>& category(const ChangeSet& changes, int index);

    const ChangeSet* changes_;
    const IgnoreFilter* filter_;
};

}  // namespace jdelta
