#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>
#include <QSet>
#include <QSettings>
#include <QString>
#include <QTextStream>
#include <optional>

#include "version.h"

#include "homework/core/AppConfig.hpp"
#include "homework/core/AppContext.hpp"
#include "homework/core/Logging.hpp"
#include "homework/core/Task.hpp"
#include "homework/core/TaskCoordinator.hpp"
#include "homework/ui/ConsolePresenter.hpp"

using namespace homework;

namespace {

std::optional<core::TaskPayload> commandPayload(const QStringList &args, bool byCreateDate,
                                                QString *error)
{
    const QString command = args.value(0, QStringLiteral("list"));
    const QStringList rest = args.mid(1);

    if (command == QLatin1String("list") || command == QLatin1String("stats")) {
        return core::TaskPayload{ core::RefreshTask{} };
    }
    if (command == QLatin1String("add")) {
        if (rest.size() != 5) {
            *error = QObject::tr("usage: add CODE SUBJECT CONTENT CREATE_DATE DUE_DATE");
            return std::nullopt;
        }
        return core::TaskPayload{ core::AddTask{ rest[0], rest[1], rest[2], rest[3], rest[4] } };
    }
    if (command == QLatin1String("query")) {
        if (rest.size() != 1) {
            *error = QObject::tr("usage: query DATE [--created]");
            return std::nullopt;
        }
        core::QueryTask query;
        query.date = rest[0];
        query.field = byCreateDate ? core::QueryField::CreateDate : core::QueryField::DueDate;
        return core::TaskPayload{ query };
    }
    if (command == QLatin1String("delete")) {
        if (rest.isEmpty()) {
            *error = QObject::tr("usage: delete CODE...");
            return std::nullopt;
        }
        core::DeleteTask remove;
        for (const QString &code : rest) {
            remove.codes.insert(code);
        }
        return core::TaskPayload{ remove };
    }
    if (command == QLatin1String("complete")) {
        if (rest.size() != 1) {
            *error = QObject::tr("usage: complete CODE");
            return std::nullopt;
        }
        return core::TaskPayload{ core::MarkCompletedTask{ rest[0] } };
    }
    if (command == QLatin1String("clear")) {
        return core::TaskPayload{ core::ClearAllTask{} };
    }
    *error = QObject::tr("unknown command '%1'").arg(command);
    return std::nullopt;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("HomeworkRecord"));
    QCoreApplication::setApplicationName(QStringLiteral("homework-record"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kHomeworkRecordVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Homework tracker"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption fileOption(QStringList{ QStringLiteral("f"), QStringLiteral("file") },
                                        QObject::tr("Homework document to use."),
                                        QObject::tr("path"));
    const QCommandLineOption createdOption(QStringLiteral("created"),
                                           QObject::tr("Query by creation date instead of due date."));
    const QCommandLineOption progressOption(QStringLiteral("progress"),
                                            QObject::tr("Print load progress."));
    parser.addOption(fileOption);
    parser.addOption(createdOption);
    parser.addOption(progressOption);
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QObject::tr("list | stats | add | query | delete | complete | clear"));
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    const QStringList args = parser.positionalArguments();
    QString usageError;
    const auto payload = commandPayload(args, parser.isSet(createdOption), &usageError);
    if (!payload) {
        err << usageError << '\n';
        return 2;
    }

    QSettings settings;
    core::AppConfig config = core::AppConfig::load(settings);
    if (parser.isSet(fileOption)) {
        config.dataFile = parser.value(fileOption);
    }

    ui::ConsolePresenter presenter(out, err);
    presenter.setShowPartialResults(parser.isSet(progressOption));
    const core::TaskKind commandKind = core::taskKind(*payload);
    const QString command = args.value(0, QStringLiteral("list"));
    if (command == QLatin1String("stats")) {
        presenter.setShowList(false);
    } else if (commandKind != core::TaskKind::Refresh) {
        presenter.setShowList(false);
        presenter.setShowAggregates(false);
    }

    core::AppContext context(config, presenter);
    auto &coordinator = context.coordinator();

    bool failed = false;
    const bool documentExists = QFileInfo::exists(config.dataFile);
    QObject::connect(&coordinator, &core::TaskCoordinator::taskFailed, &app,
                     [&failed, &coordinator, commandKind, documentExists](core::TaskKind kind,
                                                                          const QString &) {
                         // A missing document is expected before the first save.
                         if (kind != core::TaskKind::Load || documentExists
                             || commandKind == core::TaskKind::Refresh) {
                             failed = true;
                         }
                         // Do not run a change against a document that could not be read.
                         // The current tick still reports the drained queue.
                         if (kind == core::TaskKind::Load && documentExists) {
                             coordinator.stop();
                         }
                     });
    QObject::connect(&coordinator, &core::TaskCoordinator::taskStarted, &app,
                     [&presenter](core::TaskKind kind) {
                         if (kind == core::TaskKind::Query) {
                             presenter.setShowList(true);
                         }
                     });
    QObject::connect(&coordinator, &core::TaskCoordinator::drained, &app, &QCoreApplication::quit);

    coordinator.submit(core::LoadTask{});
    // The load already refreshes the list.
    if (commandKind != core::TaskKind::Refresh) {
        coordinator.submit(*payload);
    }

    qCDebug(lcApp) << "homework-record" << kHomeworkRecordVersion << "running" << command;
    context.start();
    const int rc = app.exec();
    context.stop();
    return rc != 0 ? rc : (failed ? 1 : 0);
}
