// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "slate/api/IFrameScheduler.hpp"

#include <QtCore/QHash>
#include <QtCore/QObject>

class QTimer;

namespace Slate::Internal {

// One single-shot precise timer per outstanding frame request.
class SLATE_EXPORT TimerFrameScheduler final : public QObject, public Api::IFrameScheduler
{
    Q_OBJECT

public:
    explicit TimerFrameScheduler(QObject* parent = nullptr);
    explicit TimerFrameScheduler(int intervalMs, QObject* parent = nullptr);
    ~TimerFrameScheduler() override;

    FrameHandle requestFrame(std::function<void()> callback) override;
    void cancelFrame(FrameHandle handle) override;

    int intervalMs() const noexcept { return m_intervalMs; }
    int pendingCount() const { return m_pending.size(); }

private:
    void fire(FrameHandle handle);

    struct Pending final {
        QTimer* timer = nullptr;
        std::function<void()> callback;
    };

    int m_intervalMs = 0;
    FrameHandle m_nextHandle = 1;
    QHash<FrameHandle, Pending> m_pending;
};

} // namespace Slate::Internal
