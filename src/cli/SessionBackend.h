/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SIDEKICK_SESSIONBACKEND_H
#define SIDEKICK_SESSIONBACKEND_H

#include "sidekick_export.h"

#include <QObject>
#include <QString>

namespace Sidekick
{

/**
 * SessionBackend is the capability interface of one way of hosting a
 * tool process (tmux session, direct child process, ...).
 *
 * A Session picks one implementation at construction and forwards to it.
 */
class SIDEKICK_EXPORT SessionBackend : public QObject
{
    Q_OBJECT

public:
    explicit SessionBackend(QObject *parent = nullptr)
        : QObject(parent)
    {
    }
    ~SessionBackend() override = default;

    /**
     * Backend name as used in config and on the command line
     */
    virtual QString name() const = 0;

    /**
     * Identifier of the hosted process, unique per backend
     */
    virtual QString sessionId() const = 0;

    /**
     * Spawn the process, or connect to it if it already runs.
     * Returns false if the process could not be started.
     */
    virtual bool start() = 0;

    virtual bool isAlive() const = 0;

    /**
     * Forward literal text to the process input
     */
    virtual bool send(const QString &text) = 0;

    /**
     * Confirm the current input (Enter)
     */
    virtual bool submit() = 0;

    /**
     * Release the process. Multiplexed backends leave it running.
     */
    virtual void detach() = 0;

    /**
     * PID of the root process hosting the tool, 0 if unknown
     */
    virtual qint64 pid() const = 0;

    /**
     * Whether ready() is emitted once the process accepts input.
     * Backends without a signal rely on the caller's grace period.
     */
    virtual bool hasReadySignal() const
    {
        return false;
    }

    virtual bool isReady() const
    {
        return isAlive();
    }

    /**
     * Shell command attaching an interactive terminal to this process,
     * empty if the backend cannot be attached from outside.
     */
    virtual QString attachCommand() const
    {
        return QString();
    }

Q_SIGNALS:
    /**
     * Emitted once when the process is ready to receive input
     */
    void ready();

    /**
     * Emitted when the process has gone away
     */
    void exited();
};

} // namespace Sidekick

#endif // SIDEKICK_SESSIONBACKEND_H
