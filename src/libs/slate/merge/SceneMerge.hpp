// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "slate/SlateGlobal.hpp"
#include "slate/merge/ElementIdRemapper.hpp"

#include <QtCore/QJsonObject>
#include <QtCore/QList>
#include <QtCore/QSet>
#include <QtCore/QString>
#include <QtCore/QStringView>

#include <optional>

namespace Slate::Api {
class ISceneHost;
}

namespace Slate::Merge {

struct SLATE_EXPORT ParsedScene final {
    QList<QJsonObject> elements;
    QList<QJsonObject> files; // values of the optional "files" object
};

/// Parses clipboard or file text. Returns std::nullopt unless the trimmed text is a
/// JSON object with an "elements" array. Non-object entries are dropped.
SLATE_EXPORT std::optional<ParsedScene> parseSceneJson(QStringView text, QString* error = nullptr);

struct SLATE_EXPORT SceneMergeResult final {
    enum class Status : unsigned char {
        Merged,
        NotSceneJson,
        NoHost
    };

    Status status = Status::NotSceneJson;
    int mergedCount = 0;
    int fileCount = 0;
    QString error;

    bool ok() const noexcept { return status == Status::Merged; }
};

SLATE_EXPORT QSet<QString> collectElementIds(const QList<QJsonObject>& elements);

/// Remaps \a incoming against \a existing and returns existing + remapped.
SLATE_EXPORT QList<QJsonObject> appendElements(const QList<QJsonObject>& existing,
                                               const QList<QJsonObject>& incoming,
                                               const IdGenerator& generator = {});

/// Merges scene JSON into \a host: files first (when any), then one scene update
/// holding the current elements followed by the remapped ones.
SLATE_EXPORT SceneMergeResult applySceneJson(QStringView text,
                                             Api::ISceneHost* host,
                                             const IdGenerator& generator = {});

} // namespace Slate::Merge
