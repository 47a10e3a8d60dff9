#pragma once

#include <QtCore/QPointer>
#include <QtWidgets/QWidget>

namespace Slate::Internal {
class ViewportHostImpl;
}

class SceneStore;

// Render surface: draws a dot grid and element bounds through the current viewport.
class CanvasSurface final : public QWidget
{
	Q_OBJECT

public:
	CanvasSurface(Slate::Internal::ViewportHostImpl* viewport, SceneStore* scene, QWidget* parent = nullptr);

	bool pasteSceneText(const QString& text);

protected:
	void paintEvent(QPaintEvent* e) override;
	void keyPressEvent(QKeyEvent* e) override;
	void contextMenuEvent(QContextMenuEvent* e) override;

private:
	void drawGrid(QPainter& p) const;
	void drawElements(QPainter& p) const;

	QPointer<Slate::Internal::ViewportHostImpl> m_viewport;
	QPointer<SceneStore> m_scene;
};
