/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ExternalTerminal.h"
#include "Session.h"

#include <QDebug>

namespace Sidekick
{

ExternalTerminal::ExternalTerminal(Session *session, const QString &terminalCommand, QObject *parent)
    : Terminal(session, parent)
    , m_terminalCommand(terminalCommand)
{
}

ExternalTerminal::~ExternalTerminal()
{
    if (m_process) {
        m_process->disconnect(this);
        if (m_process->state() != QProcess::NotRunning) {
            m_process->terminate();
            m_process->waitForFinished(1000);
        }
    }
}

QStringList ExternalTerminal::launchArguments() const
{
    if (!session()) {
        return {};
    }
    const QString attach = session()->backend()->attachCommand();
    if (attach.isEmpty()) {
        return {};
    }

    QStringList args = QProcess::splitCommand(m_terminalCommand);
    // The attach command may chain tmux commands with "\;"
    args << QStringLiteral("sh") << QStringLiteral("-c") << attach;
    return args;
}

bool ExternalTerminal::openView()
{
    const QStringList args = launchArguments();
    if (args.size() < 4) {
        qWarning() << "ExternalTerminal: session cannot be attached from a terminal";
        return false;
    }

    if (!m_process) {
        m_process = new QProcess(this);
        connect(m_process, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished), this, [this]() {
            qDebug() << "ExternalTerminal: terminal window closed";
            markClosed();
        });
        connect(m_process, &QProcess::errorOccurred, this, [this](QProcess::ProcessError error) {
            if (error == QProcess::FailedToStart) {
                qWarning() << "ExternalTerminal: failed to start" << m_terminalCommand << ":" << m_process->errorString();
                markClosed();
            }
        });
    }

    m_process->start(args.first(), args.mid(1));
    // A missing emulator may fail inside start()
    return m_process->state() != QProcess::NotRunning;
}

void ExternalTerminal::closeView()
{
    if (!m_process || m_process->state() == QProcess::NotRunning) {
        return;
    }
    // closeView() runs while the terminal is still open, keep finished() from re-entering
    m_process->blockSignals(true);
    m_process->terminate();
    if (!m_process->waitForFinished(1000)) {
        m_process->kill();
        m_process->waitForFinished(1000);
    }
    m_process->blockSignals(false);
}

} // namespace Sidekick

#include "moc_ExternalTerminal.cpp"
