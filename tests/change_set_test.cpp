#include <gtest/gtest.h>

#include <QPair>
#include <QSet>

#include "jdelta/change_set.hpp"
#include "jdelta/diff_engine.hpp"
#include "jdelta/ignore_filter.hpp"
#include "test_helpers.hpp"

using jdelta::Change;
using jdelta::ChangeSet;
using jdelta::IgnoreFilter;
using jdelta::JsonPath;

namespace {

ChangeSet profileChanges() {
    return jdelta::DiffEngine()
        .diff(
            json(R"({"name":"Alice","age":25,"address":{"city":"NYC","country":"USA"},"hobbies":["reading"]})"),
            json(R"({"name":"Alice","age":26,"address":{"city":"LA"},"hobbies":["reading","painting"]})"))
        .changes;
}

IgnoreFilter compiled(const QStringList& patterns) {
    const auto result = IgnoreFilter::compile(patterns);
    EXPECT_TRUE(result.success()) << result.error.message.toStdString();
    return result.filter;
}

}  // namespace

TEST(ChangeSetTest, PushSortsByKind) {
    ChangeSet set;
    set.push(Change::modified(JsonPath().child("a"), json("1"), json("2")));
    set.push(Change::added(JsonPath().child("b"), json("true")));
    set.push(Change::removed(JsonPath().child("c"), json("null")));

    EXPECT_EQ(set.size(), 3);
    EXPECT_FALSE(set.isEmpty());
    EXPECT_EQ(renderedPaths(set.added()), QStringList{"b"});
    EXPECT_EQ(renderedPaths(set.removed()), QStringList{"c"});
    EXPECT_EQ(renderedPaths(set.modified()), QStringList{"a"});
    EXPECT_EQ(renderedPaths(set.allChanges()), (QStringList{"b", "c", "a"}));
}

TEST(ChangeSetTest, SummaryCountsEachCategory) {
    const QJsonObject summary = profileChanges().summary();
    EXPECT_EQ(summary.value("added").toInt(), 1);
    EXPECT_EQ(summary.value("removed").toInt(), 1);
    EXPECT_EQ(summary.value("modified").toInt(), 2);
    EXPECT_EQ(summary.value("total").toInt(), 4);
}

TEST(ChangeSetTest, ChangeJsonShapes) {
    const ChangeSet set = profileChanges();
    EXPECT_EQ(QJsonValue(set.added()[0].toJson()), json(R"({"path":"hobbies[1]","value":"painting"})"));
    EXPECT_EQ(QJsonValue(set.removed()[0].toJson()), json(R"({"path":"address.country","value":"USA"})"));
    EXPECT_EQ(
        QJsonValue(set.modified()[1].toJson()),
        json(R"({"path":"age","old_value":25,"new_value":26})"));
}

TEST(ChangeSetTest, EmptyFilterKeepsEverything) {
    const ChangeSet set = profileChanges();
    const IgnoreFilter none;
    EXPECT_EQ(set.filteredChanges(none).count(), set.size());
    EXPECT_EQ(set.filterIgnorePatterns(none), set);
}

TEST(ChangeSetTest, IgnoringExactPathDropsOnlyThatChange) {
    const ChangeSet set = profileChanges();
    const IgnoreFilter filter = compiled({"age", "hobbies[1]"});

    const ChangeSet kept = set.filterIgnorePatterns(filter);
    EXPECT_TRUE(kept.added().isEmpty());
    EXPECT_EQ(renderedPaths(kept.removed()), QStringList{"address.country"});
    EXPECT_EQ(renderedPaths(kept.modified()), QStringList{"address.city"});
    EXPECT_EQ(kept.after(), set.after());
}

TEST(ChangeSetTest, IgnoringParentDoesNotHideChildren) {
    const ChangeSet set = profileChanges();
    const ChangeSet kept = set.filterIgnorePatterns(compiled({"address", "hobbies"}));
    EXPECT_EQ(kept, set);
}

// For every subset of the change paths, spelled alternately in dot and pointer form and
// padded with patterns naming only parents, the lazy view and the eager copy agree and a
// change is dropped exactly when its own path was selected.
TEST(ChangeSetTest, LazyViewMatchesEagerFilterForEveryPatternSubset) {
    const QVector<QPair<const char*, const char*>> documents{
        {R"({"name":"Alice","age":25,"address":{"city":"NYC","country":"USA"},"hobbies":["reading"]})",
         R"({"name":"Alice","age":26,"address":{"city":"LA"},"hobbies":["reading","painting"]})"},
        {R"({"a":{"b":{"c":1,"d":[1,2]}},"e":"x"})", R"({"a":{"b":{"c":2,"d":[1]}},"f":null})"},
        {R"([{"id":1,"tags":["x"]},{"id":2}])", R"([{"id":1,"tags":["y","z"]},{"id":3},true])"},
        {R"({"a/b":{"c~d":1},"k":[0]})", R"({"a/b":{"c~d":2},"k":[0,{"n":1}]})"},
        {R"("same")", R"("other")"},
    };

    for (const auto& pair : documents) {
        const ChangeSet set = jdelta::DiffEngine().diff(json(pair.first), json(pair.second)).changes;
        const QVector<Change> all = set.allChanges();
        ASSERT_FALSE(all.isEmpty()) << pair.first;
        ASSERT_LE(all.size(), 10) << pair.first;

        for (int mask = 0; mask < (1 << all.size()); ++mask) {
            QStringList patterns;
            QSet<QString> selected;
            for (int i = 0; i < all.size(); ++i) {
                const JsonPath& path = all[i].path;
                if (mask & (1 << i)) {
                    selected.insert(path.toString());
                    patterns.append(i % 2 == 0 || path.isEmpty() ? path.toString() : path.toJsonPointer());
                } else if (path.size() > 1) {
                    patterns.append(path.parent().toJsonPointer());
                }
            }

            const IgnoreFilter filter = compiled(patterns);
            const QVector<Change> lazy = set.filteredChanges(filter).toVector();
            const ChangeSet eager = set.filterIgnorePatterns(filter);
            EXPECT_EQ(lazy, eager.allChanges()) << pair.first << " mask " << mask;

            QVector<Change> expected;
            for (const Change& change : all) {
                if (!selected.contains(change.path.toString())) {
                    expected.append(change);
                }
            }
            EXPECT_EQ(lazy, expected) << pair.first << " mask " << mask;
        }
    }
}

TEST(ChangeSetTest, CopiedViewIteratesTheSameChanges) {
    const ChangeSet set = profileChanges();
    const IgnoreFilter filter = compiled({"age"});

    auto first = set.filteredChanges(filter).begin();
    ASSERT_EQ(first->path.toString(), "hobbies[1]");

    const auto view = set.filteredChanges(filter);
    const auto copy = view;
    QStringList seen;
    for (auto it = copy.begin(); it != view.end(); ++it) {
        seen.append(it->path.toString());
    }
    EXPECT_EQ(seen, (QStringList{"hobbies[1]", "address.country", "address.city"}));
    EXPECT_EQ(copy.begin(), view.begin());
}

TEST(ChangeSetTest, ViewCrossesCategoriesInOrder) {
    const ChangeSet set = profileChanges();
    // Hiding the only added change makes the view start in the removed category.
    const IgnoreFilter filter = compiled({"hobbies[1]", "address.city"});
    const auto view = set.filteredChanges(filter);

    auto it = view.begin();
    ASSERT_NE(it, view.end());
    EXPECT_EQ(it->path.toString(), "address.country");
    ++it;
    ASSERT_NE(it, view.end());
    EXPECT_EQ((*it).path.toString(), "age");
    it++;
    EXPECT_EQ(it, view.end());
    EXPECT_EQ(view.count(), 2);
}

TEST(ChangeSetTest, ViewOverFullyIgnoredSetIsEmpty) {
    const ChangeSet set = profileChanges();
    const IgnoreFilter filter = compiled({"hobbies[1]", "address.country", "address.city", "age"});
    const auto view = set.filteredChanges(filter);
    EXPECT_EQ(view.begin(), view.end());
    EXPECT_EQ(view.count(), 0);
    EXPECT_TRUE(set.filterIgnorePatterns(filter).isEmpty());
}

TEST(ChangeSetTest, EqualityComparesAllCategories) {
    ChangeSet left;
    ChangeSet right;
    EXPECT_EQ(left, right);

    left.push(Change::added(JsonPath().child("x"), json("1")));
    EXPECT_NE(left, right);
    right.push(Change::added(JsonPath().child("x"), json("1.0")));
    EXPECT_EQ(left, right);
    right.push(Change::removed(JsonPath().child("y"), json("2")));
    EXPECT_NE(left, right);
}
