
/************************************************************************\

    Modelman - Model library manager
    Copyright (C) 2026 Jango73

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.

\************************************************************************/

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QSettings>
#include <QTextStream>
#include <QTimer>

#include <csignal>
#include <memory>

#include "CivitaiClient.h"
#include "ModelCacheStore.h"
#include "ModelFolderWalker.h"
#include "ModelLibraryView.h"
#include "ModelScanController.h"
#include "ModelmanLogging.h"
#include "ScanProgressReporter.h"
#include "ScannerSettings.h"

namespace {
struct CliConstants {
    static constexpr int pollIntervalMs = 1000;
    static constexpr int exitOk = 0;
    static constexpr int exitFailure = 1;
    static constexpr int exitUsage = 2;
};

volatile std::sig_atomic_t interruptRequested = 0;

void handleInterrupt(int)
{
    interruptRequested = 1;
}

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

QString compactJson(const QJsonObject &object)
{
    return QString::fromUtf8(QJsonDocument(object).toJson(QJsonDocument::Compact));
}

ScannerSettings loadSettings(const QCommandLineParser &parser)
{
    if (parser.isSet("settings")) {
        QSettings settings(parser.value("settings"), QSettings::IniFormat);
        return ScannerSettings::load(settings);
    }
    return ScannerSettings::loadUserSettings();
}

int runScan(const QCommandLineParser &parser, const ScannerSettings &settings, ModelCacheStore &store)
{
    const QStringList folders = parser.positionalArguments().mid(1);
    const bool force = parser.isSet("force");
    const bool includeCached = !parser.isSet("skip-cached");

    std::unique_ptr<CivitaiClient> client;
    if (settings.providerEnabled) {
        client = std::make_unique<CivitaiClient>(settings);
    }
    ModelScanController controller(settings, &store, client.get());

    const QVariantMap started = controller.startScan(folders, force, includeCached);
    if (!started.value("ok").toBool()) {
        err() << started.value("error").toString() << Qt::endl;
        return CliConstants::exitUsage;
    }

    int exitCode = CliConstants::exitOk;
    QTimer poll;
    QObject::connect(&poll, &QTimer::timeout, &controller, [&controller]() {
        if (interruptRequested) {
            interruptRequested = 0;
            const QVariantMap cancelled = controller.cancelScan();
            err() << cancelled.value("message").toString() << Qt::endl;
        }
        out() << compactJson(ScanProgressReporter::toJson(controller.progressSnapshot())) << Qt::endl;
    });
    QObject::connect(&controller, &ModelScanController::scanFinished, &controller,
                     [&controller, &exitCode](const QVariantMap &result) {
        const ScanProgress progress = controller.progressSnapshot();
        out() << compactJson(ScanProgressReporter::toJson(progress)) << Qt::endl;
        out() << ScanProgressReporter::formatLine(progress) << Qt::endl;
        if (!result.value("ok").toBool()) {
            exitCode = CliConstants::exitFailure;
        }
        QCoreApplication::quit();
    });
    poll.start(CliConstants::pollIntervalMs);

    QCoreApplication::exec();
    return exitCode;
}

int runFolders(const ScannerSettings &settings)
{
    const QJsonArray folders = QJsonArray::fromVariantList(ModelFolderWalker::availableFolders(settings));
    out() << QString::fromUtf8(QJsonDocument(folders).toJson(QJsonDocument::Indented));
    return CliConstants::exitOk;
}

int runList(const QCommandLineParser &parser, const ScannerSettings &settings, const ModelCacheStore &store)
{
    ModelLibraryQuery query;
    query.search = parser.value("search");
    query.showBlacklisted = !parser.isSet("hide-blacklisted");
    query.sortOrder = parser.isSet("desc") ? Qt::DescendingOrder : Qt::AscendingOrder;

    const auto lastUsed = ModelLibraryQuery::lastUsedFilterFromName(parser.value("last-used"));
    const auto updates = ModelLibraryQuery::updateFilterFromName(parser.value("updates"));
    const auto sortKey = ModelLibraryQuery::sortKeyFromName(parser.value("sort"));
    if (!lastUsed || !updates || !sortKey) {
        err() << QCoreApplication::translate("main", "Invalid filter or sort value") << Qt::endl;
        return CliConstants::exitUsage;
    }
    query.lastUsed = *lastUsed;
    query.updates = *updates;
    query.sortKey = *sortKey;

    if (parser.isSet("category")) {
        const ModelPathUtils::FolderCategory category = ModelPathUtils::categoryFromName(parser.value("category"));
        if (category == ModelPathUtils::FolderCategory::Unknown) {
            err() << QCoreApplication::translate("main", "Unknown category: %1").arg(parser.value("category"))
                  << Qt::endl;
            return CliConstants::exitUsage;
        }
        query.category = category;
    }

    const ModelFolderWalker::WalkResult walked = ModelFolderWalker::walk(settings.allRoots(), settings.extensions);
    const QVector<ModelFileRecord> records = ModelLibraryView::build(walked.files, store, query);
    for (const ModelFileRecord &record : records) {
        QStringList flags;
        if (record.orphan) {
            flags.append("orphan");
        }
        if (record.isBlacklisted()) {
            flags.append("blacklisted");
        }
        if (record.hasUpdate()) {
            flags.append("update");
        }
        out() << ModelPathUtils::categoryName(record.folderCategory) << '\t'
              << record.displayName() << '\t'
              << (record.fingerprint.isEmpty() ? QStringLiteral("-") : record.fingerprint) << '\t'
              << flags.join(',') << '\t'
              << (record.path.isEmpty() ? QStringLiteral("-") : record.path) << Qt::endl;
    }
    return CliConstants::exitOk;
}
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("Modelman");
    QCoreApplication::setApplicationName("Modelman");
    QCoreApplication::setApplicationVersion("1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(QCoreApplication::translate("main", "Model library manager"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", QCoreApplication::translate("main", "scan, folders or list"));
    parser.addOptions({
        {"settings", QCoreApplication::translate("main", "Settings file to use."), "ini"},
        {"verbose", QCoreApplication::translate("main", "Enable debug logging.")},
        {"force", QCoreApplication::translate("main", "Re-hash files and refresh blacklisted entries.")},
        {"skip-cached", QCoreApplication::translate("main", "With --force, keep entries that already have metadata.")},
        {"search", QCoreApplication::translate("main", "Filter by name."), "text"},
        {"last-used", QCoreApplication::translate("main", "all, today, week, month or never."), "window"},
        {"updates", QCoreApplication::translate("main", "all, available or none."), "filter"},
        {"category", QCoreApplication::translate("main", "Only list one category."), "name"},
        {"hide-blacklisted", QCoreApplication::translate("main", "Hide blacklisted models.")},
        {"sort", QCoreApplication::translate("main", "name, lastused, size or type."), "key"},
        {"desc", QCoreApplication::translate("main", "Sort in descending order.")}
    });
    parser.process(app);

    if (parser.isSet("verbose")) {
        QLoggingCategory::setFilterRules(QStringLiteral("modelman.*.debug=true"));
    }

    const QStringList arguments = parser.positionalArguments();
    if (arguments.isEmpty()) {
        parser.showHelp(CliConstants::exitUsage);
    }

    const ScannerSettings settings = loadSettings(parser);
    const QString command = arguments.first();
    if (command == "folders") {
        return runFolders(settings);
    }

    ModelCacheStore store(settings.cacheDirectory);
    QString error;
    if (!store.load(&error)) {
        qCWarning(lcCache) << "Cache load problem:" << error;
    }

    if (command == "scan") {
        std::signal(SIGINT, handleInterrupt);
        return runScan(parser, settings, store);
    }
    if (command == "list") {
        return runList(parser, settings, store);
    }

    err() << QCoreApplication::translate("main", "Unknown command: %1").arg(command) << Qt::endl;
    return CliConstants::exitUsage;
}
