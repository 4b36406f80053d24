#include "mainwindow.h"
#include "app_config.h"
#include "detector.h"

#include <QApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QMetaType>

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    QCoreApplication::setOrganizationName("AssistedAnnotator");
    QCoreApplication::setApplicationName("assisted_annotator");
    QCoreApplication::setApplicationVersion("1.0.0");

    qRegisterMetaType<annot::InferenceResult>();

    QCommandLineParser parser;
    parser.setApplicationDescription("Assisted bounding-box annotation for YOLO datasets.");
    parser.addHelpOption();
    parser.addVersionOption();
    annot::addCommandLineOptions(parser);
    parser.process(app);

    const QString configPath = parser.isSet("config") ? parser.value("config")
                                                       : annot::defaultConfigPath();
    annot::AppConfig cfg = annot::loadConfig(configPath);

    QString error;
    if (!annot::applyCommandLine(parser, &cfg, &error)) {
        qCritical().noquote() << "[Annotator]" << error;
        parser.showHelp(2);
    }

    MainWindow w(cfg, configPath);
    w.show();

    // a bad layout is reported in the window; the session stays usable
    if (!w.openConfiguredDataset())
        qWarning() << "[Annotator] could not open" << cfg.datasetRoot;

    return app.exec();
}
