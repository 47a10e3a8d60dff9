// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "slate/merge/ElementIdRemapper.hpp"

#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>

#include <memory>
#include <utility>

using Slate::Merge::IdGenerator;
using Slate::Merge::remapElementIdsForAppend;

namespace {

QJsonObject textEl(const QString& id, const QString& content)
{
    QJsonObject o;
    o.insert(QStringLiteral("id"), id);
    o.insert(QStringLiteral("kind"), QStringLiteral("text"));
    o.insert(QStringLiteral("x"), 0);
    o.insert(QStringLiteral("y"), 0);
    o.insert(QStringLiteral("content"), content);
    return o;
}

QJsonObject parse(const char* json)
{
    return QJsonDocument::fromJson(QByteArray(json)).object();
}

IdGenerator counterIds()
{
    auto n = std::make_shared<int>(0);
    return [n]() { return QStringLiteral("new-%1").arg(++*n); };
}

IdGenerator sequenceIds(QStringList ids)
{
    auto queue = std::make_shared<QStringList>(std::move(ids));
    return [queue]() { return queue->isEmpty() ? QString() : queue->takeFirst(); };
}

QStringList idsOf(const QList<QJsonObject>& elements)
{
    QStringList ids;
    for (const QJsonObject& e : elements)
        ids.push_back(e.value(QStringLiteral("id")).toString());
    return ids;
}

} // namespace

TEST(ElementIdRemapperTests, FreshIdsAvoidExistingOnes)
{
    const QSet<QString> existing = {QStringLiteral("el-1"), QStringLiteral("el-2")};
    const QList<QJsonObject> elements = {textEl(QStringLiteral("el-1"), QStringLiteral("same id as existing")),
                                         textEl(QStringLiteral("el-3"), QStringLiteral("new id"))};

    const auto out = remapElementIdsForAppend(existing, elements);
    ASSERT_EQ(out.size(), 2);

    const QStringList ids = idsOf(out);
    EXPECT_NE(ids.at(0), QStringLiteral("el-1"));
    EXPECT_NE(ids.at(1), QStringLiteral("el-3"));
    EXPECT_FALSE(existing.contains(ids.at(0)));
    EXPECT_FALSE(existing.contains(ids.at(1)));
    EXPECT_NE(ids.at(0), ids.at(1));
}

TEST(ElementIdRemapperTests, PreservesOrderAndContent)
{
    const QList<QJsonObject> elements = {textEl(QStringLiteral("a"), QStringLiteral("first")),
                                         textEl(QStringLiteral("b"), QStringLiteral("second"))};

    const auto out = remapElementIdsForAppend({}, elements, counterIds());
    ASSERT_EQ(out.size(), 2);
    EXPECT_EQ(out.at(0).value(QStringLiteral("content")).toString(), QStringLiteral("first"));
    EXPECT_EQ(out.at(1).value(QStringLiteral("content")).toString(), QStringLiteral("second"));
    EXPECT_EQ(out.at(0).value(QStringLiteral("kind")).toString(), QStringLiteral("text"));
    EXPECT_EQ(out.at(0).value(QStringLiteral("id")).toString(), QStringLiteral("new-1"));
    EXPECT_EQ(out.at(1).value(QStringLiteral("id")).toString(), QStringLiteral("new-2"));
}

TEST(ElementIdRemapperTests, DuplicateIncomingIdsBecomeDistinct)
{
    const QList<QJsonObject> elements = {textEl(QStringLiteral("dup"), QStringLiteral("one")),
                                         textEl(QStringLiteral("dup"), QStringLiteral("two")),
                                         textEl(QStringLiteral("dup"), QStringLiteral("three"))};

    const auto out = remapElementIdsForAppend({}, elements);
    ASSERT_EQ(out.size(), 3);

    const QStringList ids = idsOf(out);
    EXPECT_EQ(QSet<QString>(ids.begin(), ids.end()).size(), 3);
}

TEST(ElementIdRemapperTests, ReferencesToDuplicateIdResolveToFirstOccurrence)
{
    const QList<QJsonObject> elements = {
        parse(R"({"id":"dup","type":"rectangle"})"),
        parse(R"({"id":"dup","type":"rectangle"})"),
        parse(R"({"id":"t","type":"text","containerId":"dup"})"),
    };

    const auto out = remapElementIdsForAppend({}, elements, counterIds());
    ASSERT_EQ(out.size(), 3);
    EXPECT_EQ(out.at(2).value(QStringLiteral("containerId")).toString(),
              out.at(0).value(QStringLiteral("id")).toString());
    EXPECT_NE(out.at(1).value(QStringLiteral("id")).toString(),
              out.at(0).value(QStringLiteral("id")).toString());
}

TEST(ElementIdRemapperTests, EmptyInputGivesEmptyOutput)
{
    EXPECT_TRUE(remapElementIdsForAppend({QStringLiteral("el-1")}, {}).isEmpty());
}

TEST(ElementIdRemapperTests, GroupIdsAreRemappedConsistently)
{
    const QList<QJsonObject> elements = {
        parse(R"({"id":"a","groupIds":["g1","g2"]})"),
        parse(R"({"id":"b","groupIds":["g2",7,null]})"),
        parse(R"({"id":"c","groupIds":"not-an-array"})"),
        parse(R"({"id":"d"})"),
    };

    const auto out = remapElementIdsForAppend({}, elements, counterIds());

    const QJsonArray a = out.at(0).value(QStringLiteral("groupIds")).toArray();
    const QJsonArray b = out.at(1).value(QStringLiteral("groupIds")).toArray();
    ASSERT_EQ(a.size(), 2);
    ASSERT_EQ(b.size(), 3);

    EXPECT_NE(a.at(0).toString(), QStringLiteral("g1"));
    EXPECT_NE(a.at(0).toString(), a.at(1).toString());
    EXPECT_EQ(b.at(0).toString(), a.at(1).toString());
    EXPECT_EQ(b.at(1).toString(), QString());
    EXPECT_EQ(b.at(2).toString(), QString());
    EXPECT_TRUE(b.at(1).isString());

    EXPECT_TRUE(out.at(2).value(QStringLiteral("groupIds")).toArray().isEmpty());
    EXPECT_TRUE(out.at(3).value(QStringLiteral("groupIds")).isArray());
}

TEST(ElementIdRemapperTests, FrameAndContainerReferences)
{
    const QList<QJsonObject> elements = {
        parse(R"({"id":"frame","type":"frame"})"),
        parse(R"({"id":"box","frameId":"frame","containerId":"elsewhere"})"),
        parse(R"({"id":"label","frameId":"gone","containerId":"box"})"),
        parse(R"({"id":"loose","frameId":"","containerId":null})"),
    };

    const auto out = remapElementIdsForAppend({}, elements, counterIds());
    const QString frameId = out.at(0).value(QStringLiteral("id")).toString();
    const QString boxId = out.at(1).value(QStringLiteral("id")).toString();

    EXPECT_EQ(out.at(1).value(QStringLiteral("frameId")).toString(), frameId);
    EXPECT_TRUE(out.at(1).value(QStringLiteral("containerId")).isNull());
    EXPECT_TRUE(out.at(2).value(QStringLiteral("frameId")).isNull());
    EXPECT_EQ(out.at(2).value(QStringLiteral("containerId")).toString(), boxId);
    EXPECT_EQ(out.at(3).value(QStringLiteral("frameId")).toString(), QString());
    EXPECT_TRUE(out.at(3).value(QStringLiteral("containerId")).isNull());
}

TEST(ElementIdRemapperTests, BoundElementsAreFilteredAndRewritten)
{
    const QList<QJsonObject> elements = {
        parse(R"({"id":"rect","boundElements":[{"id":"arrow","type":"arrow"},{"id":"outside","type":"text"},{"type":"x"},3]})"),
        parse(R"({"id":"arrow","type":"arrow"})"),
    };

    const auto out = remapElementIdsForAppend({}, elements, counterIds());
    const QJsonArray bound = out.at(0).value(QStringLiteral("boundElements")).toArray();

    ASSERT_EQ(bound.size(), 1);
    const QJsonObject entry = bound.at(0).toObject();
    EXPECT_EQ(entry.value(QStringLiteral("id")).toString(), out.at(1).value(QStringLiteral("id")).toString());
    EXPECT_EQ(entry.value(QStringLiteral("type")).toString(), QStringLiteral("arrow"));
}

TEST(ElementIdRemapperTests, BindingsAreRewrittenOrCleared)
{
    const QList<QJsonObject> elements = {
        parse(R"({"id":"start"})"),
        parse(R"({"id":"line","startBinding":{"elementId":"start","focus":0.25,"gap":4},"endBinding":{"elementId":"missing"}})"),
        parse(R"({"id":"free","startBinding":null})"),
    };

    const auto out = remapElementIdsForAppend({}, elements, counterIds());
    const QJsonObject start = out.at(1).value(QStringLiteral("startBinding")).toObject();

    EXPECT_EQ(start.value(QStringLiteral("elementId")).toString(), out.at(0).value(QStringLiteral("id")).toString());
    EXPECT_DOUBLE_EQ(start.value(QStringLiteral("focus")).toDouble(), 0.25);
    EXPECT_DOUBLE_EQ(start.value(QStringLiteral("gap")).toDouble(), 4.0);
    EXPECT_TRUE(out.at(1).value(QStringLiteral("endBinding")).isNull());
    EXPECT_TRUE(out.at(2).value(QStringLiteral("startBinding")).isNull());
}

TEST(ElementIdRemapperTests, InputIsNotModified)
{
    const QList<QJsonObject> elements = {parse(R"({"id":"a","groupIds":["g"],"frameId":"b"})"),
                                         parse(R"({"id":"b"})")};
    const QList<QJsonObject> copy = elements;

    remapElementIdsForAppend({QStringLiteral("a")}, elements, counterIds());
    EXPECT_TRUE(elements == copy);
}

TEST(ElementIdRemapperTests, CollidingGeneratedIdsAreRetried)
{
    const QSet<QString> existing = {QStringLiteral("taken")};
    const QList<QJsonObject> elements = {textEl(QStringLiteral("p"), {}), textEl(QStringLiteral("q"), {})};

    const auto out = remapElementIdsForAppend(
        existing, elements, sequenceIds({QStringLiteral("taken"), QStringLiteral("x"), QStringLiteral("x"), QStringLiteral("y")}));

    EXPECT_TRUE(idsOf(out) == (QStringList{QStringLiteral("x"), QStringLiteral("y")}));
}

TEST(ElementIdRemapperTests, StuckGeneratorStillYieldsDistinctIds)
{
    const QList<QJsonObject> elements = {textEl(QStringLiteral("p"), {}), textEl(QStringLiteral("q"), {}),
                                         textEl(QStringLiteral("r"), {})};

    const auto out = remapElementIdsForAppend({QStringLiteral("same")}, elements, []() { return QStringLiteral("same"); });

    const QStringList ids = idsOf(out);
    EXPECT_EQ(QSet<QString>(ids.begin(), ids.end()).size(), 3);
    EXPECT_FALSE(ids.contains(QStringLiteral("same")));
}

TEST(ElementIdRemapperTests, ElementWithoutIdGetsFreshId)
{
    const auto out = remapElementIdsForAppend({}, {parse(R"({"type":"ellipse"})"), parse(R"({"id":42})")}, counterIds());

    ASSERT_EQ(out.size(), 2);
    EXPECT_FALSE(out.at(0).value(QStringLiteral("id")).toString().isEmpty());
    EXPECT_TRUE(out.at(1).value(QStringLiteral("id")).isString());
    EXPECT_NE(out.at(0).value(QStringLiteral("id")).toString(), out.at(1).value(QStringLiteral("id")).toString());
}

TEST(ElementIdRemapperTests, DefaultGeneratorProducesUuids)
{
    const QString id = Slate::Merge::generateElementId();
    EXPECT_EQ(id.size(), 36);
    EXPECT_FALSE(id.startsWith(QLatin1Char('{')));
}

TEST(ElementIdRemapperTests, TwoCallsMintDisjointIds)
{
    const QList<QJsonObject> elements = {textEl(QStringLiteral("a"), QStringLiteral("one")),
                                         textEl(QStringLiteral("b"), QStringLiteral("two")),
                                         textEl(QStringLiteral("c"), QStringLiteral("three"))};

    const QStringList first = idsOf(remapElementIdsForAppend({}, elements));
    const QStringList second = idsOf(remapElementIdsForAppend({}, elements));

    ASSERT_EQ(first.size(), 3);
    ASSERT_EQ(second.size(), 3);

    const QSet<QString> firstSet(first.cbegin(), first.cend());
    const QSet<QString> secondSet(second.cbegin(), second.cend());
    EXPECT_EQ(firstSet.size(), 3);
    EXPECT_EQ(secondSet.size(), 3);
    EXPECT_FALSE(firstSet.intersects(secondSet));
    EXPECT_FALSE(firstSet.contains(QStringLiteral("a")));
}
