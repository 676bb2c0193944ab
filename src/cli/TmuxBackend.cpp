/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later

    Based on Bobcat's SessionManager by İsmail Yılmaz
*/

#include "TmuxBackend.h"

#include <QDebug>
#include <QDir>
#include <QPointer>
#include <QProcess>
#include <QRandomGenerator>
#include <QRegularExpression>
#include <QStandardPaths>

namespace Sidekick
{

TmuxBackend::TmuxBackend(const Tool &tool, QObject *parent)
    : TmuxBackend(tool, buildSessionName(tool.name, generateSessionId()), parent)
{
}

TmuxBackend::TmuxBackend(const Tool &tool, const QString &sessionName, QObject *parent)
    : SessionBackend(parent)
    , m_tool(tool)
    , m_sessionName(sessionName)
    , m_readyTimer(new QTimer(this))
    , m_aliveTimer(new QTimer(this))
{
    m_readyTimer->setInterval(READY_POLL_INTERVAL_MS);
    connect(m_readyTimer, &QTimer::timeout, this, &TmuxBackend::pollReady);

    m_aliveTimer->setInterval(ALIVE_POLL_INTERVAL_MS);
    connect(m_aliveTimer, &QTimer::timeout, this, &TmuxBackend::pollAlive);
}

TmuxBackend *TmuxBackend::createForExisting(const Tool &tool, const QString &sessionName, QObject *parent)
{
    auto *backend = new TmuxBackend(tool, sessionName, parent);
    // Already running: it has drawn its UI long ago
    backend->m_ready = true;
    backend->m_running = backend->sessionExists();
    if (backend->m_running) {
        backend->m_aliveTimer->start();
    }
    return backend;
}

TmuxBackend::~TmuxBackend() = default;

bool TmuxBackend::isAvailable()
{
    const QString tmuxPath = QStandardPaths::findExecutable(QStringLiteral("tmux"));
    return !tmuxPath.isEmpty();
}

QString TmuxBackend::generateSessionId()
{
    QString id;
    id.reserve(8);
    for (int i = 0; i < 8; ++i) {
        int r = QRandomGenerator::global()->bounded(16);
        id.append(QLatin1Char(r < 10 ? '0' + r : 'a' + (r - 10)));
    }
    return id;
}

QString TmuxBackend::buildSessionName(const QString &toolName, const QString &sessionId)
{
    QString result = QStringLiteral("sidekick-%1-%2").arg(toolName, sessionId);

    // Sanitize session name: tmux doesn't allow certain characters
    result.replace(QLatin1Char('.'), QLatin1Char('-'));
    result.replace(QLatin1Char(':'), QLatin1Char('-'));

    return result;
}

bool TmuxBackend::parseSessionName(const QString &sessionName, QString *toolName, QString *sessionId)
{
    static const QRegularExpression pattern(QStringLiteral("^sidekick-(.+)-([a-f0-9]{8})$"));
    const QRegularExpressionMatch match = pattern.match(sessionName);
    if (!match.hasMatch()) {
        return false;
    }
    if (toolName) {
        *toolName = match.captured(1);
    }
    if (sessionId) {
        *sessionId = match.captured(2);
    }
    return true;
}

QStringList TmuxBackend::buildNewSessionArgs(const QString &workingDir) const
{
    // tmux new-session -d -s <session-name> [-c <dir>] [-e K=V ...] -- [env -u K ...] <command...>
    QStringList args;
    args << QStringLiteral("new-session") << QStringLiteral("-d");
    args << QStringLiteral("-s") << m_sessionName;

    if (!workingDir.isEmpty()) {
        args << QStringLiteral("-c") << workingDir;
    }

    QStringList unset;
    for (auto it = m_tool.env.cbegin(); it != m_tool.env.cend(); ++it) {
        if (it.value().has_value()) {
            args << QStringLiteral("-e") << QStringLiteral("%1=%2").arg(it.key(), *it.value());
        } else {
            unset << QStringLiteral("-u") << it.key();
        }
    }

    args << QStringLiteral("--");
    if (!unset.isEmpty()) {
        args << QStringLiteral("env") << unset;
    }
    args << m_tool.cmd;

    return args;
}

QString TmuxBackend::buildAttachCommand() const
{
    // Suppress DCS passthrough to prevent XTVERSION responses leaking into the tool prompt
    return QStringLiteral("tmux attach-session -t %1 \\; set-option -p allow-passthrough off").arg(sessionTarget());
}

QString TmuxBackend::sessionTarget() const
{
    return QLatin1Char('=') + m_sessionName;
}

QString TmuxBackend::paneTarget() const
{
    return sessionTarget() + QLatin1Char(':');
}

QList<TmuxBackend::PaneInfo> TmuxBackend::listPanes()
{
    bool ok = false;
    const QString output = runTmux({QStringLiteral("list-panes"), QStringLiteral("-a"), QStringLiteral("-F"), QStringLiteral("#{session_name}:#{pane_pid}")}, &ok);
    if (!ok) {
        return {};
    }
    return parsePaneList(output);
}

QList<TmuxBackend::PaneInfo> TmuxBackend::parsePaneList(const QString &output)
{
    QList<PaneInfo> panes;

    const QStringList lines = output.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        // Session names may contain ':' in foreign sessions, the pid is always last
        const int sep = line.lastIndexOf(QLatin1Char(':'));
        if (sep <= 0) {
            continue;
        }
        bool converted = false;
        const qint64 pid = line.mid(sep + 1).trimmed().toLongLong(&converted);
        if (!converted || pid <= 0) {
            continue;
        }
        PaneInfo info;
        info.sessionName = line.left(sep);
        info.pid = pid;
        panes.append(info);
    }

    return panes;
}

bool TmuxBackend::sessionExists() const
{
    bool ok = false;
    runTmux({QStringLiteral("has-session"), QStringLiteral("-t"), sessionTarget()}, &ok);
    return ok;
}

bool TmuxBackend::pasteText(const QString &text)
{
    if (text.isEmpty()) {
        return true;
    }

    if (m_tool.muxFocus) {
        executeCommand({QStringLiteral("select-pane"), QStringLiteral("-t"), paneTarget()});
    }

    // A named buffer per session so concurrent sessions never paste each other's text
    const QString buffer = QStringLiteral("sidekick-%1").arg(m_sessionName);
    bool ok = false;
    executeCommand({QStringLiteral("load-buffer"), QStringLiteral("-b"), buffer, QStringLiteral("-")}, &ok, text.toUtf8());
    if (!ok) {
        return false;
    }

    executeCommand({QStringLiteral("paste-buffer"), QStringLiteral("-b"), buffer, QStringLiteral("-d"), QStringLiteral("-p"), QStringLiteral("-t"), paneTarget()},
                   &ok);
    return ok;
}

bool TmuxBackend::sendKeySequence(const QString &keyName)
{
    bool ok = false;
    executeCommand({QStringLiteral("send-keys"), QStringLiteral("-t"), paneTarget(), keyName}, &ok);
    return ok;
}

void TmuxBackend::capturePaneAsync(std::function<void(bool, const QString &)> callback)
{
    executeCommandAsync({QStringLiteral("capture-pane"), QStringLiteral("-t"), paneTarget(), QStringLiteral("-p")}, callback);
}

bool TmuxBackend::start()
{
    if (sessionExists()) {
        qDebug() << "TmuxBackend: attaching to running session" << m_sessionName;
        m_running = true;
        startMonitoring();
        return true;
    }

    bool ok = false;
    executeCommand(buildNewSessionArgs(QDir::currentPath()), &ok);
    if (!ok) {
        qWarning() << "TmuxBackend: failed to start session" << m_sessionName << "for" << m_tool.name;
        return false;
    }

    qDebug() << "TmuxBackend: started session" << m_sessionName << "running" << m_tool.cmd;
    m_running = true;
    m_ready = false;
    m_readyPolls = 0;
    startMonitoring();
    return true;
}

void TmuxBackend::startMonitoring()
{
    if (!m_ready) {
        m_readyTimer->start();
    }
    m_aliveTimer->start();
}

bool TmuxBackend::send(const QString &text)
{
    return pasteText(text);
}

bool TmuxBackend::submit()
{
    return sendKeySequence(QStringLiteral("Enter"));
}

void TmuxBackend::detach()
{
    m_readyTimer->stop();
    m_aliveTimer->stop();

    // The tmux session keeps running and can be rediscovered later.
    // detach-client fails when no client is attached, that is fine.
    bool ok = false;
    runTmux({QStringLiteral("detach-client"), QStringLiteral("-s"), sessionTarget()}, &ok);
    qDebug() << "TmuxBackend: detached from" << m_sessionName << "(clients detached:" << ok << ")";
}

qint64 TmuxBackend::pid() const
{
    bool ok = false;
    const QString output =
        runTmux({QStringLiteral("display-message"), QStringLiteral("-p"), QStringLiteral("-t"), paneTarget(), QStringLiteral("#{pane_pid}")}, &ok);
    if (!ok) {
        return 0;
    }
    bool converted = false;
    const qint64 pid = output.trimmed().toLongLong(&converted);
    return converted ? pid : 0;
}

void TmuxBackend::pollReady()
{
    if (m_ready) {
        m_readyTimer->stop();
        return;
    }
    if (++m_readyPolls > READY_POLL_LIMIT) {
        // Some tools draw nothing until they get input
        qWarning() << "TmuxBackend: no output from" << m_sessionName << "after" << READY_POLL_LIMIT * READY_POLL_INTERVAL_MS << "ms, assuming it is ready";
        setReady();
        return;
    }

    QPointer<TmuxBackend> guard(this);
    capturePaneAsync([this, guard](bool ok, const QString &output) {
        if (!guard || !ok || m_ready) {
            return;
        }
        // The tool has drawn something: its input is up
        if (!output.trimmed().isEmpty()) {
            setReady();
        }
    });
}

void TmuxBackend::setReady()
{
    m_ready = true;
    m_readyTimer->stop();
    qDebug() << "TmuxBackend: session" << m_sessionName << "is ready";
    Q_EMIT ready();
}

void TmuxBackend::pollAlive()
{
    QPointer<TmuxBackend> guard(this);
    executeCommandAsync(
        {QStringLiteral("has-session"), QStringLiteral("-t"), sessionTarget()},
        [this, guard](bool ok, const QString &) {
            if (!guard || ok || !m_running) {
                return;
            }
            qDebug() << "TmuxBackend: session" << m_sessionName << "has exited";
            m_running = false;
            m_readyTimer->stop();
            m_aliveTimer->stop();
            Q_EMIT exited();
        },
        false);
}

QString TmuxBackend::runTmux(const QStringList &args, bool *ok, const QByteArray &input, QString *errorOutput)
{
    QProcess process;
    process.start(QStringLiteral("tmux"), args);

    if (!input.isNull()) {
        if (!process.waitForStarted(5000)) {
            if (ok) {
                *ok = false;
            }
            return QString();
        }
        process.write(input);
        process.closeWriteChannel();
    }

    if (!process.waitForFinished(10000)) {
        if (ok) {
            *ok = false;
        }
        return QString();
    }

    const bool success = process.exitStatus() == QProcess::NormalExit && process.exitCode() == 0;
    if (ok) {
        *ok = success;
    }
    if (!success && errorOutput) {
        *errorOutput = QString::fromUtf8(process.readAllStandardError()).trimmed();
    }

    return QString::fromUtf8(process.readAllStandardOutput());
}

QString TmuxBackend::executeCommand(const QStringList &args, bool *ok, const QByteArray &input) const
{
    bool success = false;
    QString errorOutput;
    const QString output = runTmux(args, &success, input, &errorOutput);
    if (ok) {
        *ok = success;
    }

    if (!success && !errorOutput.isEmpty()) {
        Q_EMIT const_cast<TmuxBackend *>(this)->errorOccurred(errorOutput);
    }

    return output;
}

void TmuxBackend::executeCommandAsync(const QStringList &args, std::function<void(bool, const QString &)> callback, bool reportErrors)
{
    auto *process = new QProcess(this);
    connect(process,
            QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished),
            this,
            [this, process, callback, reportErrors](int exitCode, QProcess::ExitStatus status) {
        bool ok = (status == QProcess::NormalExit && exitCode == 0);
        QString output = QString::fromUtf8(process->readAllStandardOutput());
        if (!ok && reportErrors) {
            QString errorOutput = QString::fromUtf8(process->readAllStandardError());
            if (!errorOutput.isEmpty()) {
                Q_EMIT errorOccurred(errorOutput);
            }
        }
        if (callback) {
            callback(ok, output);
        }
        process->deleteLater();
    });
    connect(process, &QProcess::errorOccurred, this, [process, callback](QProcess::ProcessError error) {
        if (error != QProcess::FailedToStart) {
            return;
        }
        if (callback) {
            callback(false, QString());
        }
        process->deleteLater();
    });
    process->start(QStringLiteral("tmux"), args);
}

} // namespace Sidekick

#include "moc_TmuxBackend.cpp"
