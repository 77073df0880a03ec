#include "config/ServiceSettings.h"
#include "core/Clock.h"
#include "core/Logging.h"
#include "execution/ExecutionService.h"
#include "question/QuestionRepository.h"
#include "server/ApiRouter.h"
#include "server/AssessmentServer.h"
#include "server/JsonCodec.h"
#include "service/AssessmentService.h"
#include "session/SessionLedger.h"
#include "session/SessionStore.h"
#include "workspace/WorkspaceMaterializer.h"
#include "Version.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QLoggingCategory>
#include <QSettings>
#include <QTextStream>

#include <csignal>
#include <memory>

namespace {

QTextStream &out() {
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err() {
    static QTextStream stream(stderr);
    return stream;
}

void printJson(const QJsonObject &object) {
    out() << QJsonDocument(object).toJson(QJsonDocument::Indented);
    out().flush();
}

int reportError(const EngineError &error) {
    err() << error.kindName() << ": " << error.message << Qt::endl;
    return EXIT_FAILURE;
}

// "path" submits the local file under its own name; "name=path" renames it.
bool readCandidateFiles(const QStringList &args, QMap<QString, QString> *files) {
    for (const QString &arg : args) {
        const qsizetype eq = arg.indexOf('=');
        const QString name = eq > 0 ? arg.left(eq) : QFileInfo(arg).fileName();
        const QString path = eq > 0 ? arg.mid(eq + 1) : arg;
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly)) {
            err() << "Cannot read " << path << ": " << file.errorString() << Qt::endl;
            return false;
        }
        files->insert(name, QString::fromUtf8(file.readAll()));
    }
    return true;
}

std::unique_ptr<QSettings> openSettings(const QString &configPath) {
    if (!configPath.isEmpty()) {
        return std::make_unique<QSettings>(configPath, QSettings::IniFormat);
    }
    return std::make_unique<QSettings>("PairBench", "PairBench");
}

} // namespace

int main(int argc, char *argv[]) {
    // Ignore SIGPIPE so writing to a closed socket or to a sandbox pipe
    // that already exited doesn't kill the server.
#ifndef _WIN32
    std::signal(SIGPIPE, SIG_IGN);
#endif

    QCoreApplication app(argc, argv);
    app.setOrganizationName("PairBench");
    app.setApplicationName("pairbench");
    app.setApplicationVersion(PairBench::kVersion);
    qSetMessagePattern("%{time yyyy-MM-dd hh:mm:ss.zzz} %{type} %{category}: %{message}");

    QCommandLineParser parser;
    parser.setApplicationDescription("Stage-gated sandboxed assessment backend with a pair-programming coach.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "serve | run <question> [files...] | questions | init-config <path>");

    const QCommandLineOption configOption({"c", "config"}, "Read settings from an INI file.", "path");
    const QCommandLineOption portOption({"p", "port"}, "Port for serve.", "port");
    const QCommandLineOption questionsOption("questions-root", "Directory holding the questions.", "dir");
    const QCommandLineOption runtimeOption("runtime", "Sandbox runtime: docker or local.", "runtime");
    const QCommandLineOption stageOption("stage", "Highest stage index to run (run command).", "index", "0");
    const QCommandLineOption listenAnyOption("listen-any", "Listen on all interfaces instead of localhost.");
    parser.addOptions({configOption, portOption, questionsOption, runtimeOption, stageOption, listenAnyOption});
    parser.process(app);

    const std::unique_ptr<QSettings> store = openSettings(parser.value(configOption));
    ServiceSettings settings = ServiceSettings::load(*store);
    if (parser.isSet(portOption)) {
        settings.port = static_cast<quint16>(parser.value(portOption).toUInt());
    }
    if (parser.isSet(questionsOption)) {
        settings.questionsRoot = parser.value(questionsOption);
    }
    if (parser.isSet(runtimeOption)) {
        settings.sandbox.runtime = SandboxConfig::runtimeFromName(parser.value(runtimeOption));
    }
    if (!settings.loggingRules.isEmpty()) {
        QLoggingCategory::setFilterRules(QString(settings.loggingRules).replace(';', '\n'));
    }

    const QStringList args = parser.positionalArguments();
    const QString command = args.value(0, "serve");

    if (command == "init-config") {
        if (args.size() < 2) {
            parser.showHelp(EXIT_FAILURE);
        }
        QSettings target(args.at(1), QSettings::IniFormat);
        ServiceSettings().save(target);
        target.sync();
        if (target.status() != QSettings::NoError) {
            err() << "Cannot write " << args.at(1) << Qt::endl;
            return EXIT_FAILURE;
        }
        return EXIT_SUCCESS;
    }

    QuestionRepository repository(settings.questionsRoot);

    if (command == "questions") {
        printJson(QJsonObject{{"questions", QJsonArray::fromStringList(repository.questionNames())}});
        return EXIT_SUCCESS;
    }

    const WorkspaceMaterializer materializer(settings.scratchRoot);
    const ExecutionService executionService(repository, materializer,
                                            ExecutionService::sandboxRunnerFactory(settings.sandbox));

    if (command == "run") {
        if (args.size() < 2) {
            parser.showHelp(EXIT_FAILURE);
        }
        QMap<QString, QString> files;
        if (!readCandidateFiles(args.mid(2), &files)) {
            return EXIT_FAILURE;
        }
        EngineError error;
        const auto outcome = executionService.runCode(args.at(1), files, parser.value(stageOption).toInt(), &error);
        if (!outcome) {
            return reportError(error);
        }
        printJson(JsonCodec::aggregateToJson(outcome->aggregate, outcome->runtimeMs));
        return outcome->aggregate.currentPassed ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    if (command != "serve") {
        err() << "Unknown command: " << command << Qt::endl;
        parser.showHelp(EXIT_FAILURE);
    }

    SystemClock clock;
    InMemorySessionStore sessionStore;
    SessionLedger ledger(sessionStore, clock, settings.sessionLimits);
    AssessmentService service(repository, executionService, ledger, clock,
                              CoachSettings{settings.coach, settings.journalDir}, settings.scratchRoot);
    ApiRouter router(service);
    AssessmentServer server(router);
    QObject::connect(&server, &AssessmentServer::errorOccurred, [](const QString &message) {
        qCCritical(lcServer) << message;
    });

    const QHostAddress address = parser.isSet(listenAnyOption) ? QHostAddress(QHostAddress::Any)
                                                               : QHostAddress(QHostAddress::LocalHost);
    if (!server.start(settings.port, address)) {
        return EXIT_FAILURE;
    }
    qCInfo(lcServer) << "pairbench" << PairBench::versionString() << "serving" << settings.questionsRoot
                     << "with the" << SandboxConfig::runtimeName(settings.sandbox.runtime) << "runtime";
    return app.exec();
}
