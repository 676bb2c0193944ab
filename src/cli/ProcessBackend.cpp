/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ProcessBackend.h"
#include "TmuxBackend.h"

#include <QDebug>
#include <QPointer>
#include <QProcessEnvironment>
#include <QTimer>

namespace Sidekick
{

ProcessBackend::ProcessBackend(const Tool &tool, QObject *parent)
    : SessionBackend(parent)
    , m_tool(tool)
    , m_sessionId(TmuxBackend::generateSessionId())
    , m_process(new QProcess(this))
{
    m_process->setProcessChannelMode(QProcess::MergedChannels);

    connect(m_process, &QProcess::started, this, [this]() {
        qDebug() << "ProcessBackend: started" << m_tool.name << "pid" << m_process->processId();
        Q_EMIT ready();
    });
    connect(m_process, &QProcess::readyRead, this, [this]() {
        const QByteArray data = m_process->readAll();
        m_output.append(data);
        Q_EMIT outputReceived(data);
    });
    connect(m_process, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished), this, [this](int exitCode, QProcess::ExitStatus status) {
        qDebug() << "ProcessBackend:" << m_tool.name << "exited with code" << exitCode << (status == QProcess::CrashExit ? "(crashed)" : "");
        Q_EMIT exited();
    });
    connect(m_process, &QProcess::errorOccurred, this, [this](QProcess::ProcessError error) {
        if (error == QProcess::FailedToStart) {
            qWarning() << "ProcessBackend: failed to start" << m_tool.cmd << ":" << m_process->errorString();
            Q_EMIT exited();
        }
    });
}

ProcessBackend::~ProcessBackend()
{
    if (m_process->state() != QProcess::NotRunning) {
        m_process->kill();
        m_process->waitForFinished(1000);
    }
}

bool ProcessBackend::start()
{
    if (isAlive()) {
        return true;
    }
    if (m_tool.cmd.isEmpty()) {
        return false;
    }

    QProcessEnvironment environment = QProcessEnvironment::systemEnvironment();
    m_tool.applyEnvironment(environment);
    m_process->setProcessEnvironment(environment);

    m_process->start(m_tool.cmd.first(), m_tool.cmd.mid(1));
    // started() / errorOccurred() report the outcome asynchronously
    return true;
}

bool ProcessBackend::isAlive() const
{
    // A process still starting counts as alive, it is just not ready yet
    return m_process->state() != QProcess::NotRunning;
}

bool ProcessBackend::send(const QString &text)
{
    if (!isReady()) {
        return false;
    }
    return m_process->write(text.toUtf8()) >= 0;
}

bool ProcessBackend::submit()
{
    if (!isReady()) {
        return false;
    }
    return m_process->write("\r") >= 0;
}

void ProcessBackend::detach()
{
    if (m_process->state() == QProcess::NotRunning) {
        return;
    }

    m_process->closeWriteChannel();
    m_process->terminate();

    QPointer<QProcess> process(m_process);
    QTimer::singleShot(TERMINATE_TIMEOUT_MS, this, [process]() {
        if (process && process->state() != QProcess::NotRunning) {
            qWarning() << "ProcessBackend: process did not terminate, killing it";
            process->kill();
        }
    });
}

qint64 ProcessBackend::pid() const
{
    return m_process->processId();
}

} // namespace Sidekick

#include "moc_ProcessBackend.cpp"
