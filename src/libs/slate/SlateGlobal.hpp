// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>
#include <QtCore/QLoggingCategory>

#if defined(SLATE_BUILD_SHARED) && (SLATE_BUILD_SHARED == 1)
#	if defined(SLATE_LIBRARY)
#		define SLATE_EXPORT Q_DECL_EXPORT
#	else
#		define SLATE_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define SLATE_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(slatelog)
Q_DECLARE_LOGGING_CATEGORY(slategesturelog)
Q_DECLARE_LOGGING_CATEGORY(slatemergelog)
Q_DECLARE_LOGGING_CATEGORY(slatesettingslog)
