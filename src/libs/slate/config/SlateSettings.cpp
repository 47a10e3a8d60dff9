// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "slate/config/SlateSettings.hpp"

#include <cmath>

namespace Slate::Config {

double readBoundedDouble(QStringView key, const QVariant& raw, double def, double lo, double hi)
{
    if (!raw.isValid() || raw.isNull())
        return def;

    bool ok = false;
    const double v = raw.toDouble(&ok);
    if (!ok || !std::isfinite(v)) {
        qCWarning(slatesettingslog) << "Ignoring malformed value for" << key << raw;
        return def;
    }
    if (v < lo || v > hi) {
        qCWarning(slatesettingslog) << "Ignoring out-of-range value for" << key << v
                                    << "expected" << lo << "to" << hi;
        return def;
    }
    return v;
}

int readBoundedInt(QStringView key, const QVariant& raw, int def, int lo, int hi)
{
    if (!raw.isValid() || raw.isNull())
        return def;

    bool ok = false;
    const int v = raw.toInt(&ok);
    if (!ok) {
        qCWarning(slatesettingslog) << "Ignoring malformed value for" << key << raw;
        return def;
    }
    if (v < lo || v > hi) {
        qCWarning(slatesettingslog) << "Ignoring out-of-range value for" << key << v
                                    << "expected" << lo << "to" << hi;
        return def;
    }
    return v;
}

std::optional<Qt::MouseButton> panButtonFromName(QStringView name)
{
    const QString n = name.trimmed().toString().toLower();
    if (n == u"right"_s)
        return Qt::RightButton;
    if (n == u"middle"_s)
        return Qt::MiddleButton;
    if (n == u"left"_s)
        return Qt::LeftButton;
    return std::nullopt;
}

QString panButtonName(Qt::MouseButton button)
{
    switch (button) {
        case Qt::LeftButton:
            return u"left"_s;
        case Qt::MiddleButton:
            return u"middle"_s;
        default:
            return u"right"_s;
    }
}

Qt::MouseButton readPanButton(QStringView key, const QVariant& raw, Qt::MouseButton def)
{
    if (!raw.isValid() || raw.isNull())
        return def;

    const auto button = panButtonFromName(raw.toString());
    if (!button) {
        qCWarning(slatesettingslog) << "Unknown pan button for" << key << raw.toString()
                                    << "(expected right, middle or left)";
        return def;
    }
    return *button;
}

ZoomLimits normalizedZoomLimits(ZoomLimits limits)
{
    if (limits.minZoom > limits.maxZoom) {
        qCWarning(slatesettingslog) << "minZoom" << limits.minZoom << "exceeds maxZoom" << limits.maxZoom
                                    << "- swapping";
        std::swap(limits.minZoom, limits.maxZoom);
    }
    return limits;
}

} // namespace Slate::Config
