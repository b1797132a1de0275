/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: y-cruncher Stress GUI entry point.
 * License: MIT
 * **********************************************************/

#include "AppInfo.h"
#include "ConfigStore.h"
#include "Logging.h"
#include "MainWindow.h"

#include <QApplication>
#include <QCommandLineParser>

int main(int argc, char** argv) {
    QApplication app(argc, argv);
    app.setApplicationName(APP_ID);
    app.setApplicationDisplayName(APP_NAME);
    app.setApplicationVersion(VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription("Graphical front-end for the y-cruncher stress test.");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOpt("config", "Read and write settings in <file>.", "file", ConfigStore::defaultPath());
    QCommandLineOption exeOpt("executable", "Use the y-cruncher binary at <path>.", "path");
    parser.addOption(configOpt);
    parser.addOption(exeOpt);
    parser.process(app);

    if (!installLogHandler(logDirPath()))
        qCWarning(lcUi) << "Cannot open app.log in" << logDirPath() << "- logging to stderr only";
    qCInfo(lcUi) << APP_NAME << VERSION << "starting";

    MainWindow w(parser.value(configOpt), parser.value(exeOpt)); w.show();
    return app.exec();
}
