// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "slate/SlateGlobal.hpp"

Q_LOGGING_CATEGORY(slatelog, "slate.viewport")
Q_LOGGING_CATEGORY(slategesturelog, "slate.gesture")
Q_LOGGING_CATEGORY(slatemergelog, "slate.merge")
Q_LOGGING_CATEGORY(slatesettingslog, "slate.settings")
