/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SIDEKICK_SESSION_H
#define SIDEKICK_SESSION_H

#include "sidekick_export.h"

#include "SessionBackend.h"
#include "Tool.h"

#include <QList>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QStringList>

#include <functional>

namespace Sidekick
{

class ToolRegistry;

/**
 * Session is a live handle to one running instance of a tool.
 *
 * How the process is hosted is decided by the SessionBackend picked at
 * construction. Input issued before the backend reports readiness is
 * queued and delivered in call order.
 */
class SIDEKICK_EXPORT Session : public QObject
{
    Q_OBJECT

public:
    using BackendFactory = std::function<SessionBackend *(const Tool &tool, QObject *parent)>;

    /**
     * Wrap a backend. The session takes ownership of it.
     */
    Session(const Tool &tool, SessionBackend *backend, QObject *parent = nullptr);
    ~Session() override;

    /**
     * Register the built-in backends ("tmux", "process"). Idempotent.
     */
    static void setup();

    /**
     * Add or replace a backend factory
     */
    static void registerBackend(const QString &name, const BackendFactory &factory);

    static QStringList backends();

    /**
     * Create a session for a tool on the named backend.
     * Returns nullptr if the backend is unknown.
     */
    static Session *create(const Tool &tool, const QString &backendName, QObject *parent = nullptr);

    /**
     * Find tmux sessions running a known tool (e.g. left over from a
     * previous run), skipping the session ids in knownIds.
     */
    static QList<Session *> discover(const ToolRegistry &tools, const QStringList &knownIds, QObject *parent = nullptr);

    QString id() const
    {
        return m_backend->sessionId();
    }

    QString toolName() const
    {
        return m_tool.name;
    }

    const Tool &tool() const
    {
        return m_tool;
    }

    QString backendName() const
    {
        return m_backend->name();
    }

    SessionBackend *backend() const
    {
        return m_backend;
    }

    /**
     * Start (or connect to) the process
     */
    bool start();

    bool isAlive() const;
    bool isReady() const;

    /**
     * Forward literal text to the process.
     * Returns false and emits livenessLost() if the process is gone.
     */
    bool send(const QString &text);

    /**
     * Confirm the current input.
     * Returns false and emits livenessLost() if the process is gone.
     */
    bool submit();

    /**
     * Release the process, drops anything still queued
     */
    void detach();

    /**
     * Whether a live process belongs to this session's tool
     */
    bool isProc(const ProcInfo &proc) const;

    /**
     * Run callback once the process accepts input.
     *
     * With a backend readiness signal the callback runs on ready(), or after
     * fallbackMs if the signal does not come first. Without one it runs
     * after fallbackMs. It never runs if the session is destroyed first.
     *
     * When fallbackMs passes without the signal the session is treated as
     * ready: queued input is delivered and later input is no longer held.
     */
    void whenReady(int fallbackMs, const std::function<void()> &callback);

    /**
     * Number of operations waiting for readiness
     */
    int pendingCount() const
    {
        return m_pending.size();
    }

Q_SIGNALS:
    void ready();
    void exited();

    /**
     * Input was issued to a process that has exited
     */
    void livenessLost();

private:
    struct PendingOp {
        enum class Kind {
            Send,
            Submit
        };
        Kind kind = Kind::Send;
        QString text;
    };

    bool shouldQueue() const;
    bool dispatch(const PendingOp &op);
    void flushPending();
    void onBackendExited();
    void onReadyTimeout();

    Tool m_tool;
    SessionBackend *m_backend = nullptr;
    QList<PendingOp> m_pending;
    bool m_exited = false;
    bool m_readyAssumed = false;
};

} // namespace Sidekick

#endif // SIDEKICK_SESSION_H
