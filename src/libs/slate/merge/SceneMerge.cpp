// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "slate/merge/SceneMerge.hpp"

#include "slate/api/ISceneHost.hpp"

#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonParseError>

namespace Slate::Merge {

std::optional<ParsedScene> parseSceneJson(QStringView text, QString* error)
{
    auto fail = [error](const QString& message) -> std::optional<ParsedScene> {
        if (error)
            *error = message;
        return std::nullopt;
    };

    const QStringView trimmed = text.trimmed();
    if (trimmed.isEmpty())
        return fail(QStringLiteral("Text is empty."));

    QJsonParseError pe{};
    const QJsonDocument doc = QJsonDocument::fromJson(trimmed.toUtf8(), &pe);
    if (pe.error != QJsonParseError::NoError)
        return fail(QStringLiteral("Invalid JSON: %1").arg(pe.errorString()));
    if (!doc.isObject())
        return fail(QStringLiteral("Scene JSON must be an object."));

    const QJsonObject root = doc.object();
    const QJsonValue elements = root.value(QStringLiteral("elements"));
    if (!elements.isArray())
        return fail(QStringLiteral("Scene JSON has no \"elements\" array."));

    ParsedScene scene;
    for (const QJsonValue& v : elements.toArray()) {
        if (v.isObject())
            scene.elements.push_back(v.toObject());
    }

    const QJsonValue files = root.value(QStringLiteral("files"));
    if (files.isObject()) {
        const QJsonObject fileMap = files.toObject();
        for (auto it = fileMap.begin(); it != fileMap.end(); ++it) {
            if (it.value().isObject())
                scene.files.push_back(it.value().toObject());
        }
    }

    return scene;
}

QSet<QString> collectElementIds(const QList<QJsonObject>& elements)
{
    QSet<QString> ids;
    ids.reserve(elements.size());
    for (const QJsonObject& el : elements) {
        const QJsonValue id = el.value(QStringLiteral("id"));
        if (id.isString())
            ids.insert(id.toString());
    }
    return ids;
}

QList<QJsonObject> appendElements(const QList<QJsonObject>& existing,
                                  const QList<QJsonObject>& incoming,
                                  const IdGenerator& generator)
{
    QList<QJsonObject> merged = existing;
    merged.append(remapElementIdsForAppend(collectElementIds(existing), incoming, generator));
    return merged;
}

SceneMergeResult applySceneJson(QStringView text, Api::ISceneHost* host, const IdGenerator& generator)
{
    SceneMergeResult result;

    QString err;
    const auto parsed = parseSceneJson(text, &err);
    if (!parsed) {
        result.status = SceneMergeResult::Status::NotSceneJson;
        result.error = err;
        qCDebug(slatemergelog) << "Not scene JSON:" << err;
        return result;
    }

    if (!host) {
        result.status = SceneMergeResult::Status::NoHost;
        result.error = QStringLiteral("No scene host is available.");
        qCWarning(slatemergelog) << "Scene JSON received without a scene host";
        return result;
    }

    const QList<QJsonObject> merged = appendElements(host->sceneElements(), parsed->elements, generator);

    if (!parsed->files.isEmpty())
        host->addFiles(parsed->files);
    host->updateScene(merged);

    result.status = SceneMergeResult::Status::Merged;
    result.mergedCount = static_cast<int>(parsed->elements.size());
    result.fileCount = static_cast<int>(parsed->files.size());

    qCInfo(slatemergelog) << "Merged" << result.mergedCount << "element(s) and"
                          << result.fileCount << "file(s) into the scene";
    return result;
}

} // namespace Slate::Merge
