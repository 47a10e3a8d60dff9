// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "SlateTestSupport.hpp"

#include "slate/controllers/GestureEventFilters.hpp"
#include "slate/internal/ViewportHostImpl.hpp"

#include <QtCore/QCoreApplication>
#include <QtGui/QContextMenuEvent>
#include <QtGui/QMouseEvent>
#include <QtGui/QWheelEvent>
#include <QtTest/QTest>
#include <QtWidgets/QWidget>

using namespace Slate::Controllers;
using Slate::Internal::ViewportHostImpl;
using Slate::ViewportState;

namespace {

QWheelEvent makeWheel(QPointF pos, QPoint angleDelta, Qt::KeyboardModifiers mods = Qt::NoModifier,
                      QPoint pixelDelta = QPoint())
{
    return QWheelEvent(pos, pos, pixelDelta, angleDelta, Qt::NoButton, mods, Qt::NoScrollPhase, false);
}

QMouseEvent makeMouse(QEvent::Type type, QPointF pos, Qt::MouseButton button, Qt::MouseButtons buttons)
{
    return QMouseEvent(type, pos, pos, button, buttons, Qt::NoModifier);
}

bool send(QObject* receiver, QEvent* event)
{
    QCoreApplication::sendEvent(receiver, event);
    return event->isAccepted();
}

} // namespace

TEST(WheelEventConversionTests, AngleDeltaBecomesBrowserPixels)
{
    SlateTest::ensureApp();

    const QWheelEvent down = makeWheel(QPointF(10.0, 20.0), QPoint(0, -120));
    const WheelInput in = WheelEventFilter::wheelInputFromEvent(down);
    EXPECT_DOUBLE_EQ(in.deltaY, 100.0);
    EXPECT_DOUBLE_EQ(in.deltaX, 0.0);
    EXPECT_EQ(in.position, QPointF(10.0, 20.0));
}

TEST(WheelEventConversionTests, PixelDeltaWinsAndModifiersMap)
{
    SlateTest::ensureApp();

    const QWheelEvent ev = makeWheel(QPointF(), QPoint(0, 120), Qt::ControlModifier | Qt::ShiftModifier, QPoint(3, 30));
    const WheelInput in = WheelEventFilter::wheelInputFromEvent(ev);
    EXPECT_DOUBLE_EQ(in.deltaX, -3.0);
    EXPECT_DOUBLE_EQ(in.deltaY, -30.0);
    EXPECT_TRUE(in.modifierPan);
    EXPECT_TRUE(in.modifierShift);
    EXPECT_FALSE(in.modifierZoomOnly);

    const WheelInput meta = WheelEventFilter::wheelInputFromEvent(makeWheel(QPointF(), QPoint(0, 120), Qt::MetaModifier));
    EXPECT_TRUE(meta.modifierPan);
}

TEST(WheelEventFilterTests, WheelOnSurfaceZoomsAndIsConsumed)
{
    SlateTest::ensureApp();
    QWidget surface;
    ViewportHostImpl host;
    const Teardown teardown = setupWheelZoom(&surface, &host);

    QWheelEvent ev = makeWheel(QPointF(200.0, 150.0), QPoint(0, 120));
    send(&surface, &ev);

    EXPECT_NEAR(host.state().zoom, 1.2, 1e-12);
    teardown();
}

TEST(WheelEventFilterTests, ShiftWheelReachesTheWidget)
{
    SlateTest::ensureApp();
    QWidget surface;
    ViewportHostImpl host;
    const Teardown teardown = setupWheelZoom(&surface, &host);

    QWheelEvent ev = makeWheel(QPointF(200.0, 150.0), QPoint(0, 120), Qt::ShiftModifier);
    send(&surface, &ev);
    EXPECT_EQ(host.updateCount(), 0);
    teardown();
}

TEST(WheelEventFilterTests, EventsForOtherWidgetsPassThrough)
{
    SlateTest::ensureApp();
    QWidget surface;
    auto* child = new QWidget(&surface);
    ViewportHostImpl host;
    const Teardown teardown = setupWheelZoom(&surface, &host);

    QWheelEvent ev = makeWheel(QPointF(5.0, 5.0), QPoint(0, 120));
    send(child, &ev);
    EXPECT_EQ(host.updateCount(), 0);
    teardown();
}

TEST(WheelEventFilterTests, TeardownIsIdempotent)
{
    SlateTest::ensureApp();
    QWidget surface;
    ViewportHostImpl host;
    const Teardown teardown = setupWheelZoom(&surface, &host);
    const Teardown copy = teardown;

    teardown();
    copy();
    teardown();

    QWheelEvent ev = makeWheel(QPointF(5.0, 5.0), QPoint(0, 120));
    send(&surface, &ev);
    EXPECT_EQ(host.updateCount(), 0);
}

TEST(WheelEventFilterTests, TeardownAfterSurfaceIsGone)
{
    SlateTest::ensureApp();
    ViewportHostImpl host;
    auto* surface = new QWidget;
    const Teardown teardown = setupWheelZoom(surface, &host);
    delete surface;

    teardown();
    SUCCEED();
}

TEST(WheelEventFilterTests, NullSurfaceGivesNoopTeardown)
{
    SlateTest::ensureApp();
    ViewportHostImpl host;
    const Teardown teardown = setupWheelZoom(nullptr, &host);
    ASSERT_TRUE(static_cast<bool>(teardown));
    teardown();
}

namespace {

// Counts the context menus that reach the widget. Leaves them unaccepted like QWidget does.
class MenuRecordingWidget : public QWidget
{
public:
    int menus = 0;
    QPoint lastMenuPos;

protected:
    void contextMenuEvent(QContextMenuEvent* event) override
    {
        ++menus;
        lastMenuPos = event->pos();
        QWidget::contextMenuEvent(event);
    }
};

} // namespace

class DragPanEventFilterTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        SlateTest::ensureApp();
        surface.resize(400, 300);
        teardown = setupDragPan(&surface, &host, &frames);
    }

    void TearDown() override { teardown(); }

    SlateTest::AppScope appScope;
    MenuRecordingWidget surface;
    ViewportHostImpl host;
    SlateTest::ManualFrameScheduler frames;
    Teardown teardown;
};

TEST_F(DragPanEventFilterTests, RightDragPansAndSuppressesContextMenu)
{
    QMouseEvent down = makeMouse(QEvent::MouseButtonPress, QPointF(100.0, 100.0), Qt::RightButton, Qt::RightButton);
    send(&surface, &down);
    EXPECT_EQ(surface.cursor().shape(), Qt::OpenHandCursor);

    QMouseEvent move = makeMouse(QEvent::MouseMove, QPointF(130.0, 90.0), Qt::NoButton, Qt::RightButton);
    send(&surface, &move);
    EXPECT_EQ(surface.cursor().shape(), Qt::ClosedHandCursor);
    EXPECT_EQ(frames.pendingCount(), 1);

    QMouseEvent up = makeMouse(QEvent::MouseButtonRelease, QPointF(130.0, 90.0), Qt::RightButton, Qt::NoButton);
    send(&surface, &up);

    EXPECT_DOUBLE_EQ(host.state().panX, 30.0);
    EXPECT_DOUBLE_EQ(host.state().panY, -10.0);
    EXPECT_EQ(surface.cursor().shape(), Qt::ArrowCursor);

    QContextMenuEvent menu(QContextMenuEvent::Mouse, QPoint(130, 90));
    EXPECT_TRUE(send(&surface, &menu));

    // Only the menu that follows the pan is swallowed.
    QContextMenuEvent second(QContextMenuEvent::Mouse, QPoint(130, 90));
    EXPECT_FALSE(send(&surface, &second));
}

TEST_F(DragPanEventFilterTests, PressTimeMenuIsSwallowedWhenDragPans)
{
    QMouseEvent down = makeMouse(QEvent::MouseButtonPress, QPointF(100.0, 100.0), Qt::RightButton, Qt::RightButton);
    send(&surface, &down);

    QContextMenuEvent menu(QContextMenuEvent::Mouse, QPoint(100, 100));
    EXPECT_TRUE(send(&surface, &menu));
    EXPECT_EQ(surface.menus, 0);

    QMouseEvent move = makeMouse(QEvent::MouseMove, QPointF(140.0, 100.0), Qt::NoButton, Qt::RightButton);
    send(&surface, &move);
    QMouseEvent up = makeMouse(QEvent::MouseButtonRelease, QPointF(140.0, 100.0), Qt::RightButton, Qt::NoButton);
    EXPECT_TRUE(send(&surface, &up));

    QCoreApplication::sendPostedEvents(&surface, QEvent::ContextMenu);
    QCoreApplication::processEvents();
    EXPECT_EQ(surface.menus, 0);
    EXPECT_DOUBLE_EQ(host.state().panX, 40.0);
}

TEST_F(DragPanEventFilterTests, PressTimeMenuIsDeliveredOnceAfterClick)
{
    QMouseEvent down = makeMouse(QEvent::MouseButtonPress, QPointF(60.0, 70.0), Qt::RightButton, Qt::RightButton);
    send(&surface, &down);

    QContextMenuEvent menu(QContextMenuEvent::Mouse, QPoint(60, 70));
    EXPECT_TRUE(send(&surface, &menu));
    EXPECT_EQ(surface.menus, 0);

    QMouseEvent up = makeMouse(QEvent::MouseButtonRelease, QPointF(60.0, 70.0), Qt::RightButton, Qt::NoButton);
    send(&surface, &up);
    EXPECT_EQ(surface.menus, 0);

    QCoreApplication::sendPostedEvents(&surface, QEvent::ContextMenu);
    EXPECT_EQ(surface.menus, 1);
    EXPECT_EQ(surface.lastMenuPos, QPoint(60, 70));

    QCoreApplication::sendPostedEvents(&surface, QEvent::ContextMenu);
    QCoreApplication::processEvents();
    EXPECT_EQ(surface.menus, 1);
    EXPECT_EQ(host.updateCount(), 0);
}

TEST_F(DragPanEventFilterTests, LeftButtonIsIgnored)
{
    QMouseEvent down = makeMouse(QEvent::MouseButtonPress, QPointF(10.0, 10.0), Qt::LeftButton, Qt::LeftButton);
    send(&surface, &down);
    QMouseEvent move = makeMouse(QEvent::MouseMove, QPointF(50.0, 50.0), Qt::NoButton, Qt::LeftButton);
    send(&surface, &move);

    EXPECT_EQ(frames.requested, 0);
    EXPECT_EQ(host.updateCount(), 0);
}

TEST_F(DragPanEventFilterTests, HideCancelsActiveDrag)
{
    QMouseEvent down = makeMouse(QEvent::MouseButtonPress, QPointF(0.0, 0.0), Qt::RightButton, Qt::RightButton);
    send(&surface, &down);
    QMouseEvent move = makeMouse(QEvent::MouseMove, QPointF(8.0, 6.0), Qt::NoButton, Qt::RightButton);
    send(&surface, &move);

    QEvent hide(QEvent::Hide);
    send(&surface, &hide);

    EXPECT_EQ(frames.pendingCount(), 0);
    EXPECT_DOUBLE_EQ(host.state().panX, 8.0);
    EXPECT_DOUBLE_EQ(host.state().panY, 6.0);

    QMouseEvent late = makeMouse(QEvent::MouseMove, QPointF(80.0, 60.0), Qt::NoButton, Qt::RightButton);
    send(&surface, &late);
    EXPECT_EQ(frames.pendingCount(), 0);
}

TEST_F(DragPanEventFilterTests, TeardownCancelsPendingFrameAndResetsCursor)
{
    QMouseEvent down = makeMouse(QEvent::MouseButtonPress, QPointF(0.0, 0.0), Qt::RightButton, Qt::RightButton);
    send(&surface, &down);
    QMouseEvent move = makeMouse(QEvent::MouseMove, QPointF(8.0, 6.0), Qt::NoButton, Qt::RightButton);
    send(&surface, &move);

    teardown();
    teardown();

    EXPECT_EQ(frames.pendingCount(), 0);
    EXPECT_EQ(host.updateCount(), 0);
    EXPECT_EQ(surface.cursor().shape(), Qt::ArrowCursor);

    QContextMenuEvent menu(QContextMenuEvent::Mouse, QPoint(8, 6));
    EXPECT_FALSE(send(&surface, &menu));
}

namespace {

class MouseRecordingWidget : public QWidget
{
public:
    int presses = 0;
    int moves = 0;
    int releases = 0;
    QPointF lastPos;

protected:
    void mousePressEvent(QMouseEvent* event) override { ++presses; lastPos = event->position(); }
    void mouseMoveEvent(QMouseEvent* event) override { ++moves; lastPos = event->position(); }
    void mouseReleaseEvent(QMouseEvent* event) override { ++releases; lastPos = event->position(); }
};

} // namespace

class TouchEventFilterTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        SlateTest::ensureApp();
        device = QTest::createTouchDevice();

        TouchPanZoomOptions opts;
        opts.onTwoFingerTap = [this](const QPointF& c) { taps.push_back(c); };
        opts.onGestureEnd = [this]() { ++ends; };

        surface.resize(400, 300);
        teardown = setupTouchPanZoom(&surface, &host, opts);
        surface.show();
        ASSERT_TRUE(QTest::qWaitForWindowExposed(&surface));
    }

    void TearDown() override { teardown(); }

    SlateTest::AppScope appScope;
    MouseRecordingWidget surface;
    ViewportHostImpl host;
    QPointingDevice* device = nullptr;
    QList<QPointF> taps;
    int ends = 0;
    Teardown teardown;
};

TEST_F(TouchEventFilterTests, AcceptsTouchEvents)
{
    EXPECT_TRUE(surface.testAttribute(Qt::WA_AcceptTouchEvents));
}

TEST_F(TouchEventFilterTests, PinchZoomsViewport)
{
    QTest::touchEvent(&surface, device).press(0, QPoint(150, 150)).press(1, QPoint(250, 150));
    QTest::touchEvent(&surface, device).move(0, QPoint(100, 150)).move(1, QPoint(300, 150));
    QTest::touchEvent(&surface, device).release(0, QPoint(100, 150)).release(1, QPoint(300, 150));

    EXPECT_NEAR(host.state().zoom, 2.0, 1e-9);
    EXPECT_TRUE(taps.isEmpty());
    EXPECT_EQ(ends, 1);
}

TEST_F(TouchEventFilterTests, QuickTwoFingerTapIsReported)
{
    QTest::touchEvent(&surface, device).press(0, QPoint(100, 100)).press(1, QPoint(140, 100));
    QTest::touchEvent(&surface, device).release(0, QPoint(100, 100)).release(1, QPoint(140, 100));

    ASSERT_EQ(taps.size(), 1);
    EXPECT_NEAR(taps.first().x(), 120.0, 1e-9);
    EXPECT_NEAR(taps.first().y(), 100.0, 1e-9);
    EXPECT_EQ(host.updateCount(), 0);
}

TEST_F(TouchEventFilterTests, SingleFingerReachesSurfaceAsMouse)
{
    QTest::touchEvent(&surface, device).press(0, QPoint(50, 60));
    QTest::touchEvent(&surface, device).move(0, QPoint(80, 60));
    QTest::touchEvent(&surface, device).release(0, QPoint(80, 60));

    EXPECT_EQ(surface.presses, 1);
    EXPECT_GE(surface.moves, 1);
    EXPECT_EQ(surface.releases, 1);
    EXPECT_EQ(surface.lastPos, QPointF(80.0, 60.0));
    EXPECT_EQ(host.updateCount(), 0);
    EXPECT_EQ(ends, 0);
}

TEST_F(TouchEventFilterTests, SecondFingerEndsForwardedDragAndPinches)
{
    QTest::touchEvent(&surface, device).press(0, QPoint(150, 150));
    EXPECT_EQ(surface.presses, 1);

    QTest::touchEvent(&surface, device).stationary(0).press(1, QPoint(250, 150));
    EXPECT_EQ(surface.releases, 1);

    QTest::touchEvent(&surface, device).move(0, QPoint(100, 150)).move(1, QPoint(300, 150));
    QTest::touchEvent(&surface, device).release(0, QPoint(100, 150)).release(1, QPoint(300, 150));

    EXPECT_NEAR(host.state().zoom, 2.0, 1e-9);
    EXPECT_EQ(surface.presses, 1);
    EXPECT_EQ(surface.releases, 1);
    EXPECT_EQ(ends, 1);
}
