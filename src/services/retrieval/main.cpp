#include "retrieval_service.h"
#include "core/shared/settings_manager.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonDocument>

#include <cstdio>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("pdfchat-retrieval"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Per-session PDF indexing and hybrid retrieval over a local socket."));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption settingsOption(
        QStringLiteral("settings"),
        QStringLiteral("Read settings from <file> instead of $PDFCHAT_SETTINGS."),
        QStringLiteral("file"));
    const QCommandLineOption printSettingsOption(
        QStringLiteral("print-settings"),
        QStringLiteral("Print the effective settings as JSON and exit."));
    parser.addOption(settingsOption);
    parser.addOption(printSettingsOption);
    parser.process(app);

    if (parser.isSet(settingsOption)) {
        qputenv("PDFCHAT_SETTINGS", parser.value(settingsOption).toLocal8Bit());
    }

    if (parser.isSet(printSettingsOption)) {
        const pc::RetrievalSettings settings =
            pc::SettingsManager::load().value_or(pc::RetrievalSettings{});
        const QByteArray json = QJsonDocument(pc::SettingsManager::toJson(settings))
                                    .toJson(QJsonDocument::Indented);
        std::fwrite(json.constData(), 1, static_cast<size_t>(json.size()), stdout);
        return 0;
    }

    pc::RetrievalService service;
    return service.run();
}
