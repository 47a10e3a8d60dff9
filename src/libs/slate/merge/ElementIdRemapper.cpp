// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "slate/merge/ElementIdRemapper.hpp"

#include <QtCore/QHash>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonValue>
#include <QtCore/QUuid>

#include <utility>

using namespace Qt::StringLiterals;

namespace Slate::Merge {

namespace {

constexpr int kMaxMintAttempts = 64;

// Hands out ids that collide neither with the scene nor with each other.
class IdMinter final
{
public:
    IdMinter(const QSet<QString>& existing, const IdGenerator& generator)
        : m_existing(existing)
        , m_generator(generator ? generator : IdGenerator(&generateElementId))
    {}

    QString mint()
    {
        for (int attempt = 0; attempt < kMaxMintAttempts; ++attempt) {
            const QString id = m_generator();
            if (accept(id))
                return id;
        }

        // The generator keeps repeating itself; derive a unique id from a counter.
        const QString base = generateElementId();
        for (;;) {
            const QString id = u"%1-%2"_s.arg(base).arg(++m_fallbackCounter);
            if (accept(id)) {
                qCWarning(slatemergelog) << "Id generator produced only collisions, using" << id;
                return id;
            }
        }
    }

private:
    bool accept(const QString& id)
    {
        if (id.isEmpty() || m_existing.contains(id) || m_issued.contains(id))
            return false;
        m_issued.insert(id);
        return true;
    }

    const QSet<QString>& m_existing;
    IdGenerator m_generator;
    QSet<QString> m_issued;
    quint64 m_fallbackCounter = 0;
};

QJsonValue remapReference(const QJsonValue& ref, const QHash<QString, QString>& idMap)
{
    const auto it = idMap.constFind(ref.toString());
    return it != idMap.cend() ? QJsonValue(*it) : QJsonValue(QJsonValue::Null);
}

QJsonValue remapBinding(const QJsonValue& binding, const QHash<QString, QString>& idMap)
{
    QJsonObject obj = binding.toObject();
    const auto it = idMap.constFind(obj.value("elementId"_L1).toString());
    if (it == idMap.cend())
        return QJsonValue(QJsonValue::Null);
    obj.insert("elementId"_L1, *it);
    return obj;
}

bool hasBindingTarget(const QJsonValue& binding)
{
    if (!binding.isObject())
        return false;
    const QJsonValue target = binding.toObject().value("elementId"_L1);
    return !target.isUndefined() && !target.isNull();
}

} // namespace

QString generateElementId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

QList<QJsonObject> remapElementIdsForAppend(const QSet<QString>& existingIds,
                                            const QList<QJsonObject>& elements,
                                            const IdGenerator& generator)
{
    QList<QJsonObject> out;
    if (elements.isEmpty())
        return out;

    IdMinter minter(existingIds, generator);

    QHash<QString, QString> idMap;
    QHash<QString, QString> groupIdMap;
    for (const QJsonObject& el : elements) {
        const QJsonValue id = el.value("id"_L1);
        if (id.isString() && !idMap.contains(id.toString()))
            idMap.insert(id.toString(), minter.mint());

        const QJsonValue groups = el.value("groupIds"_L1);
        if (!groups.isArray())
            continue;
        for (const QJsonValue& gid : groups.toArray()) {
            if (gid.isString() && !groupIdMap.contains(gid.toString()))
                groupIdMap.insert(gid.toString(), minter.mint());
        }
    }

    QSet<QString> seenIds;
    out.reserve(elements.size());

    for (const QJsonObject& el : elements) {
        QJsonObject next = el;

        // Later repeats of an id get their own identity; references resolve to the first.
        const QJsonValue id = el.value("id"_L1);
        if (id.isString() && !seenIds.contains(id.toString())) {
            seenIds.insert(id.toString());
            next.insert("id"_L1, idMap.value(id.toString()));
        } else {
            next.insert("id"_L1, minter.mint());
        }

        QJsonArray groupIds;
        const QJsonValue groups = el.value("groupIds"_L1);
        if (groups.isArray()) {
            for (const QJsonValue& gid : groups.toArray())
                groupIds.append(gid.isString() ? groupIdMap.value(gid.toString()) : QString());
        }
        next.insert("groupIds"_L1, groupIds);

        const QJsonValue frameId = el.value("frameId"_L1);
        if (frameId.isString() && !frameId.toString().isEmpty())
            next.insert("frameId"_L1, remapReference(frameId, idMap));

        const QJsonValue containerId = el.value("containerId"_L1);
        if (containerId.isString())
            next.insert("containerId"_L1, remapReference(containerId, idMap));

        const QJsonValue bound = el.value("boundElements"_L1);
        if (bound.isArray()) {
            QJsonArray kept;
            for (const QJsonValue& entry : bound.toArray()) {
                if (!entry.isObject())
                    continue;
                QJsonObject b = entry.toObject();
                const QJsonValue bid = b.value("id"_L1);
                if (!bid.isString() || !idMap.contains(bid.toString()))
                    continue;
                b.insert("id"_L1, idMap.value(bid.toString()));
                kept.append(b);
            }
            next.insert("boundElements"_L1, kept);
        }

        for (const auto key : {"startBinding"_L1, "endBinding"_L1}) {
            const QJsonValue binding = el.value(key);
            if (hasBindingTarget(binding))
                next.insert(key, remapBinding(binding, idMap));
        }

        out.push_back(std::move(next));
    }

    return out;
}

} // namespace Slate::Merge
