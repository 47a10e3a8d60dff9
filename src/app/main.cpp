#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QFile>
#include <QtCore/QLoggingCategory>

#include <QtWidgets/QApplication>
#include <QtWidgets/QMainWindow>
#include <QtWidgets/QStatusBar>

#include "CanvasSurface.hpp"
#include "SceneStore.hpp"

#include "slate/ViewportGestureHost.hpp"
#include "slate/config/SlateSettingsQtPolicy.hpp"
#include "slate/internal/ViewportHostImpl.hpp"

static bool importSceneFile(CanvasSurface& surface, const QString& path)
{
	QFile f(path);
	if (!f.open(QIODevice::ReadOnly | QIODevice::Text)) {
		qCritical().noquote() << "Cannot open" << path << ":" << f.errorString();
		return false;
	}
	return surface.pasteSceneText(QString::fromUtf8(f.readAll()));
}

int main(int argc, char** argv)
{
	QApplication app(argc, argv);
	QCoreApplication::setOrganizationName(QStringLiteral("Slate"));
	QCoreApplication::setApplicationName(QStringLiteral("slate-demo"));

	QCommandLineParser parser;
	parser.setApplicationDescription(QStringLiteral("Infinite canvas viewport demo"));
	parser.addHelpOption();
	QCommandLineOption settingsOpt(QStringLiteral("settings"),
	                               QStringLiteral("Read gesture settings from <file> (INI)."),
	                               QStringLiteral("file"));
	parser.addOption(settingsOpt);
	parser.addPositionalArgument(QStringLiteral("scene"), QStringLiteral("Scene JSON files to import."));
	parser.process(app);

	Slate::Config::SettingsConfig cfg;
	cfg.organizationName = QCoreApplication::organizationName();
	cfg.applicationName = QCoreApplication::applicationName();
	cfg.filePathOverride = parser.value(settingsOpt);

	const Slate::Config::Settings settings(cfg);
	const Slate::Config::GestureSettings gestures = settings.gestureSettings();

	Slate::Internal::ViewportHostImpl viewport;
	viewport.setZoomLimits(gestures.zoomLimits);

	SceneStore scene;

	QMainWindow window;
	auto* surface = new CanvasSurface(&viewport, &scene, &window);
	window.setCentralWidget(surface);
	window.resize(1024, 720);

	Slate::ViewportGestureHost gestureHost(surface, &viewport, gestures);
	gestureHost.attach();

	auto showZoom = [&]() {
		window.statusBar()->showMessage(QStringLiteral("Zoom %1%").arg(qRound(viewport.state().zoom * 100.0)));
	};
	QObject::connect(&viewport, &Slate::Api::IViewportHost::viewportChanged, &window, showZoom);
	QObject::connect(&gestureHost, &Slate::ViewportGestureHost::twoFingerTapped, &window, [&](const QPointF& at) {
		const auto world = gestureHost.worldFromScreen(at);
		if (world)
			window.statusBar()->showMessage(QStringLiteral("Two-finger tap at (%1, %2)")
			                                    .arg(world->x(), 0, 'f', 1)
			                                    .arg(world->y(), 0, 'f', 1), 2000);
	});
	showZoom();

	for (const QString& path : parser.positionalArguments())
		importSceneFile(*surface, path);

	window.show();
	const int rc = app.exec();

	gestureHost.teardown();
	return rc;
}
