#include "CanvasSurface.hpp"

#include "SceneStore.hpp"

#include "slate/internal/ViewportHostImpl.hpp"
#include "slate/merge/SceneMerge.hpp"

#include <QtGui/QAction>
#include <QtGui/QClipboard>
#include <QtGui/QContextMenuEvent>
#include <QtGui/QGuiApplication>
#include <QtGui/QKeyEvent>
#include <QtGui/QKeySequence>
#include <QtGui/QPainter>
#include <QtWidgets/QMenu>

#include <cmath>

namespace {

constexpr double kGridStep = 24.0;
constexpr double kMinScreenGridStep = 8.0;

const QColor kBackgroundColor(0xf8, 0xf9, 0xfa);
const QColor kGridColor(0xc8, 0xcc, 0xd2);
const QColor kElementColor(0x1e, 0x1e, 0x1e);

} // namespace

CanvasSurface::CanvasSurface(Slate::Internal::ViewportHostImpl* viewport, SceneStore* scene, QWidget* parent)
	: QWidget(parent)
	, m_viewport(viewport)
	, m_scene(scene)
{
	setFocusPolicy(Qt::StrongFocus);
	setMinimumSize(320, 240);

	if (viewport)
		connect(viewport, &Slate::Api::IViewportHost::viewportChanged, this, qOverload<>(&QWidget::update));
	if (scene)
		connect(scene, &SceneStore::sceneChanged, this, qOverload<>(&QWidget::update));
}

bool CanvasSurface::pasteSceneText(const QString& text)
{
	const Slate::Merge::SceneMergeResult r = Slate::Merge::applySceneJson(text, m_scene);
	if (!r.ok()) {
		qWarning().noquote() << "Paste ignored:" << r.error;
		return false;
	}
	return true;
}

void CanvasSurface::paintEvent(QPaintEvent* e)
{
	Q_UNUSED(e);

	QPainter p(this);
	p.setRenderHints(QPainter::Antialiasing, true);
	p.fillRect(rect(), kBackgroundColor);

	drawGrid(p);
	drawElements(p);
}

void CanvasSurface::drawGrid(QPainter& p) const
{
	if (!m_viewport)
		return;

	const Slate::ViewportState vp = m_viewport->state();
	double step = kGridStep * vp.zoom;
	while (step > 0.0 && step < kMinScreenGridStep)
		step *= 2.0;
	if (!(step > 0.0))
		return;

	const double x0 = std::fmod(vp.panX, step);
	const double y0 = std::fmod(vp.panY, step);

	p.setPen(QPen(kGridColor, 1.5));
	for (double x = x0 < 0 ? x0 + step : x0; x < width(); x += step) {
		for (double y = y0 < 0 ? y0 + step : y0; y < height(); y += step)
			p.drawPoint(QPointF(x, y));
	}
}

void CanvasSurface::drawElements(QPainter& p) const
{
	if (!m_viewport || !m_scene)
		return;

	const Slate::ViewportState vp = m_viewport->state();

	p.save();
	p.translate(vp.panX, vp.panY);
	p.scale(vp.zoom, vp.zoom);
	p.setPen(QPen(kElementColor, 1.0 / vp.zoom));
	p.setBrush(Qt::NoBrush);

	for (const QJsonObject& el : m_scene->sceneElements()) {
		const QRectF r(el.value(QStringLiteral("x")).toDouble(),
		               el.value(QStringLiteral("y")).toDouble(),
		               el.value(QStringLiteral("width")).toDouble(),
		               el.value(QStringLiteral("height")).toDouble());
		if (r.isEmpty())
			continue;
		if (el.value(QStringLiteral("type")).toString() == QStringLiteral("ellipse"))
			p.drawEllipse(r);
		else
			p.drawRect(r);
	}
	p.restore();
}

void CanvasSurface::keyPressEvent(QKeyEvent* e)
{
	if (e->matches(QKeySequence::Paste)) {
		if (const QClipboard* cb = QGuiApplication::clipboard())
			pasteSceneText(cb->text());
		e->accept();
		return;
	}
	QWidget::keyPressEvent(e);
}

void CanvasSurface::contextMenuEvent(QContextMenuEvent* e)
{
	QMenu menu(this);
	QAction* reset = menu.addAction(QStringLiteral("Reset View"));
	QAction* paste = menu.addAction(QStringLiteral("Paste Scene"));

	QAction* chosen = menu.exec(e->globalPos());
	if (chosen == reset && m_viewport) {
		m_viewport->resetView();
	} else if (chosen == paste) {
		if (const QClipboard* cb = QGuiApplication::clipboard())
			pasteSceneText(cb->text());
	}
	e->accept();
}
