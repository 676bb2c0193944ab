/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later

    sidekick - drive CLI assistant sessions from the command line

    Running tmux sessions started by an earlier run (or by hand) are
    picked up first, so messages reach the conversation already going on.

    Usage:
        sidekick [--backend tmux|process] [--timeout ms] <command> [args]

    Commands:
        tools                                 list known tools
        list                                  list running sessions
        new TOOL                              start a session
        send [-n TOOL] [--submit] MESSAGE     send to a running session
        my-send [-n TOOL] [--submit] MESSAGE  send, starting a session if needed
        prompt [-n TOOL] PROMPT               send a named prompt
        show [-n TOOL]                        open a terminal on a session
        close [-n TOOL] [--all]               detach terminals from sessions
*/

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QPointer>
#include <QTextStream>
#include <QTimer>

#include <KLocalizedString>

#include "Cli.h"
#include "ExternalTerminal.h"
#include "Host.h"
#include "Session.h"
#include "SidekickSettings.h"
#include "Terminal.h"

using namespace Sidekick;

namespace
{

// Host for a non-interactive caller: notices go to stderr, pickers
// choose what the command line asked for
class CommandLineHost : public Host
{
public:
    void notify(Level level, const QString &message) override
    {
        QTextStream err(stderr);
        switch (level) {
        case Level::Info:
            err << message << "\n";
            break;
        case Level::Warning:
            err << "Warning: " << message << "\n";
            break;
        case Level::Error:
            err << "Error: " << message << "\n";
            break;
        }
    }

    void selectPrompt(const QStringList &prompts, const PromptCallback &callback) override
    {
        if (!prompts.contains(promptName)) {
            notify(Level::Error, i18n("Unknown prompt: %1", promptName));
            callback(QString());
            return;
        }
        callback(promptName);
    }

    void selectSession(const QList<State *> &states, const QStringList &tools, const SelectionCallback &callback) override
    {
        Selection selection;
        if (!states.isEmpty()) {
            selection.state = states.first();
        } else if (tools.contains(toolName)) {
            selection.toolName = toolName;
        } else if (!tools.isEmpty()) {
            selection.toolName = tools.first();
        }
        callback(selection);
    }

    QString promptName;
    QString toolName;
};

int listTools(const Cli &cli, const Host &host)
{
    QTextStream out(stdout);
    const QList<Tool> tools = cli.tools().tools();
    for (const Tool &tool : tools) {
        const bool installed = host.isExecutable(tool.executable());
        out << tool.name << "\t" << tool.cmd.join(QLatin1Char(' ')) << (installed ? "" : "\t(not installed)") << "\n";
    }
    return 0;
}

int listSessions(const Cli &cli)
{
    QTextStream out(stdout);
    const QList<State *> states = cli.registry()->states();
    for (const State *state : states) {
        out << state->name() << "\t" << state->sessionId() << "\t" << state->session()->backendName() << "\n";
    }
    return 0;
}

// Quit once the delivered message has left the session queue
void quitWhenFlushed(QCoreApplication &app, Cli &cli, const QString &sessionId)
{
    State *state = cli.registry()->find(sessionId);
    QPointer<Session> session(state ? state->session() : nullptr);

    auto *poll = new QTimer(&app);
    poll->setInterval(100);
    QObject::connect(poll, &QTimer::timeout, &app, [&app, poll, session]() {
        if (session && session->isAlive() && session->pendingCount() > 0) {
            return;
        }
        poll->stop();
        app.quit();
    });
    poll->start();
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("sidekick"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));
    KLocalizedString::setApplicationDomain("sidekick");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Drive CLI assistant sessions"));
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption nameOption(QStringList() << QStringLiteral("n") << QStringLiteral("name"), QStringLiteral("Tool to address"), QStringLiteral("tool"));
    parser.addOption(nameOption);

    QCommandLineOption backendOption(QStringList() << QStringLiteral("b") << QStringLiteral("backend"),
                                     QStringLiteral("Session backend for new sessions (tmux, process)"),
                                     QStringLiteral("backend"));
    parser.addOption(backendOption);

    QCommandLineOption submitOption(QStringLiteral("submit"), QStringLiteral("Press Enter after sending"));
    parser.addOption(submitOption);

    QCommandLineOption allOption(QStringLiteral("all"), QStringLiteral("Act on every matching session"));
    parser.addOption(allOption);

    QCommandLineOption timeoutOption(QStringList() << QStringLiteral("t") << QStringLiteral("timeout"),
                                     QStringLiteral("Give up after this many milliseconds (default: 10000)"),
                                     QStringLiteral("ms"),
                                     QStringLiteral("10000"));
    parser.addOption(timeoutOption);

    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("tools, list, new, send, my-send, prompt, show, close"));
    parser.addPositionalArgument(QStringLiteral("args"), QStringLiteral("Command arguments"), QStringLiteral("[args...]"));

    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(1);
    }
    const QString command = args.first();
    const QString argument = args.mid(1).join(QLatin1Char(' '));

    SidekickSettings settings;
    if (parser.isSet(backendOption)) {
        settings.setDefaultBackend(parser.value(backendOption), false);
    }

    CommandLineHost host;
    host.toolName = parser.isSet(nameOption) ? parser.value(nameOption) : settings.defaultTool();

    Cli cli(&host, &settings);

    if (command == QLatin1String("tools")) {
        return listTools(cli, host);
    }

    cli.refresh();

    if (command == QLatin1String("list")) {
        return listSessions(cli);
    }

    if (command == QLatin1String("new")) {
        Cli::NewOptions options;
        options.name = argument.isEmpty() ? parser.value(nameOption) : argument;
        State *state = cli.newSession(options);
        if (!state) {
            return 1;
        }
        QTextStream(stdout) << state->sessionId() << "\n";
        return 0;
    }

    if (command == QLatin1String("close")) {
        Cli::HideOptions options;
        options.name = parser.value(nameOption);
        options.all = parser.isSet(allOption);
        cli.close(options);
        return 0;
    }

    int exitCode = 1;
    QObject::connect(&cli, &Cli::delivered, &app, [&app, &cli, &exitCode](const QString &sessionId, const QString &) {
        exitCode = 0;
        quitWhenFlushed(app, cli, sessionId);
    });

    if (command == QLatin1String("send") || command == QLatin1String("my-send")) {
        if (argument.isEmpty()) {
            QTextStream(stderr) << "Error: nothing to send\n";
            return 1;
        }
        Cli::SendOptions options;
        options.name = parser.value(nameOption);
        options.submit = parser.isSet(submitOption);
        options.message.msg = argument;
        if (command == QLatin1String("send")) {
            cli.send(options);
        } else {
            cli.mySend(options);
        }
    } else if (command == QLatin1String("prompt")) {
        host.promptName = argument;
        Cli::PromptOptions options;
        options.name = parser.value(nameOption);
        cli.myPrompt(options);
    } else if (command == QLatin1String("show")) {
        const QString terminalCommand = settings.terminalCommand();
        cli.registry()->setTerminalFactory([terminalCommand](Session *session, QObject *parent) -> Terminal * {
            return new ExternalTerminal(session, terminalCommand, parent);
        });

        Cli::ShowOptions options;
        options.name = parser.value(nameOption);
        options.focus = true;
        cli.show(options);

        // Stay around while the terminal window is open
        const QList<State *> shown = cli.registry()->get();
        for (State *state : shown) {
            Terminal *terminal = state->terminal();
            if (terminal && terminal->isOpen()) {
                QObject::connect(terminal, &Terminal::hidden, &app, &QCoreApplication::quit);
                return app.exec();
            }
        }
        return 1;
    } else {
        QTextStream(stderr) << "Error: unknown command " << command << "\n";
        return 1;
    }

    const int timeout = parser.value(timeoutOption).toInt();
    QTimer::singleShot(timeout > 0 ? timeout : 10000, &app, [&app]() {
        QTextStream(stderr) << "Error: timed out\n";
        app.exit(1);
    });

    const int rc = app.exec();
    return rc != 0 ? rc : exitCode;
}
