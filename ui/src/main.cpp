#include <QApplication>
#include <QCommandLineParser>
#include <QGuiApplication>
#include <QMessageBox>
#include <QObject>
#include <QQmlApplicationEngine>
#include <QTextStream>

#include <optional>

#include "app/Application.hpp"
#include "utils/RuntimeUtils.hpp"

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    QGuiApplication::setOrganizationName(QStringLiteral("hengjing"));
    QGuiApplication::setApplicationName(QStringLiteral("Hengjing Popup"));
    QGuiApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    const QString platform = QGuiApplication::platformName();
    const bool showDialog = platform.compare(QStringLiteral("offscreen"), Qt::CaseInsensitive) != 0;

    QQmlApplicationEngine engine;
    Application controller(engine);

    QCommandLineParser parser;
    controller.configureParser(parser);
    parser.process(app);
    if (!controller.applyParser(parser)) {
        QTextStream(stderr) << controller.startupError() << Qt::endl;
        return EXIT_FAILURE;
    }

    // One-shot requests run beside the resident popup, so only the resident mode is exclusive.
    std::optional<hengjing::popup::utils::SingleInstanceGuard> guard;
    if (!controller.oneShotMode()) {
        const QString lockPath = hengjing::popup::utils::runtimeLockFilePath();
        QString directoryError;
        if (!hengjing::popup::utils::ensureLockFileDirectory(lockPath, &directoryError)) {
            QTextStream(stderr) << directoryError << Qt::endl;
            if (showDialog)
                QMessageBox::critical(nullptr, QGuiApplication::applicationName(), directoryError);
            return EXIT_FAILURE;
        }

        guard.emplace(lockPath);
        if (!guard->tryAcquire()) {
            const QString message = guard->errorString();
            QTextStream(stderr) << message << Qt::endl;
            if (showDialog && !guard->hasConflict())
                QMessageBox::critical(nullptr, QGuiApplication::applicationName(), message);
            return EXIT_FAILURE;
        }
    }

    int exitCode = EXIT_SUCCESS;
    QObject::connect(&controller, &Application::startupFailed, &app, [&app, &exitCode](const QString& message) {
        QTextStream(stderr) << message << Qt::endl;
        exitCode = EXIT_FAILURE;
        app.exit(EXIT_FAILURE);
    });
    QObject::connect(&controller, &Application::oneShotCompleted, &app, [&app](const QString& output) {
        QTextStream(stdout) << output << Qt::endl;
        app.exit(EXIT_SUCCESS);
    });

    engine.load(QUrl(QStringLiteral("qrc:/qml/main.qml")));
    if (engine.rootObjects().isEmpty())
        return -1;

    QMetaObject::invokeMethod(&controller, &Application::start, Qt::QueuedConnection);
    const int result = app.exec();
    controller.stop();
    return exitCode == EXIT_SUCCESS ? result : exitCode;
}
