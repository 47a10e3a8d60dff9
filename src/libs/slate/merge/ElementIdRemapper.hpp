// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "slate/SlateGlobal.hpp"

#include <QtCore/QJsonObject>
#include <QtCore/QList>
#include <QtCore/QSet>
#include <QtCore/QString>

#include <functional>

namespace Slate::Merge {

using IdGenerator = std::function<QString()>;

// Random UUID without braces.
SLATE_EXPORT QString generateElementId();

/// Returns copies of \a elements with fresh ids that are pairwise distinct and
/// absent from \a existingIds. References inside the batch (groupIds, frameId,
/// containerId, boundElements, start/endBinding) are rewritten consistently;
/// references that leave the batch are cleared to null or dropped. Order and
/// every other key are preserved. \a generator defaults to generateElementId().
SLATE_EXPORT QList<QJsonObject> remapElementIdsForAppend(const QSet<QString>& existingIds,
                                                         const QList<QJsonObject>& elements,
                                                         const IdGenerator& generator = {});

} // namespace Slate::Merge
