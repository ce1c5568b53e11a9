#include <QCoreApplication>
#include <QLoggingCategory>
#include <QString>
#include <QTextStream>
#include <cstdio>

#include "version.h"

#include "marksync/core/Config.hpp"
#include "marksync/core/Logging.hpp"
#include "marksync/core/SyncSession.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("marksync"));
    QCoreApplication::setApplicationName(QStringLiteral("marksync"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kMarksyncVersion));

    QCoreApplication app(argc, argv);
    qSetMessagePattern(QStringLiteral("%{if-warning}warning: %{endif}%{if-critical}error: %{endif}%{message}"));

    marksync::core::ConfigLoader loader;
    const auto config = loader.load(app.arguments());
    if (loader.helpRequested()) {
        QTextStream(stdout) << loader.helpText();
        return marksync::core::ExitSuccess;
    }
    if (loader.versionRequested()) {
        QTextStream(stdout) << QCoreApplication::applicationName() << ' ' << QCoreApplication::applicationVersion()
                            << '\n';
        return marksync::core::ExitSuccess;
    }
    if (!config) {
        qCCritical(lcApp).noquote() << loader.errorString();
        QTextStream(stderr) << loader.helpText();
        return marksync::core::ExitConfigError;
    }

    if (config->verbose) {
        QLoggingCategory::setFilterRules(QStringLiteral("marksync.*.debug=true"));
    }

    marksync::core::SyncSession session(*config);
    return session.run();
}
