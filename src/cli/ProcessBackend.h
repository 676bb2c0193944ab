/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SIDEKICK_PROCESSBACKEND_H
#define SIDEKICK_PROCESSBACKEND_H

#include "sidekick_export.h"

#include "SessionBackend.h"
#include "Tool.h"

#include <QProcess>

namespace Sidekick
{

/**
 * ProcessBackend spawns the tool as a direct child process and writes
 * to its stdin. The process ends with the backend.
 */
class SIDEKICK_EXPORT ProcessBackend : public SessionBackend
{
    Q_OBJECT

public:
    explicit ProcessBackend(const Tool &tool, QObject *parent = nullptr);
    ~ProcessBackend() override;

    QString name() const override
    {
        return QStringLiteral("process");
    }
    QString sessionId() const override
    {
        return m_sessionId;
    }
    bool start() override;
    bool isAlive() const override;
    bool send(const QString &text) override;
    bool submit() override;
    void detach() override;
    qint64 pid() const override;
    bool hasReadySignal() const override
    {
        return true;
    }
    bool isReady() const override
    {
        return m_process->state() == QProcess::Running;
    }

    /**
     * Everything the process wrote to stdout and stderr so far
     */
    QByteArray output() const
    {
        return m_output;
    }

Q_SIGNALS:
    void outputReceived(const QByteArray &data);

private:
    Tool m_tool;
    QString m_sessionId;
    QProcess *m_process = nullptr;
    QByteArray m_output;

    static constexpr int TERMINATE_TIMEOUT_MS = 3000;
};

} // namespace Sidekick

#endif // SIDEKICK_PROCESSBACKEND_H
