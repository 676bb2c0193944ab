/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later

    Based on Bobcat's SessionManager by İsmail Yılmaz
*/

#ifndef SIDEKICK_TMUXBACKEND_H
#define SIDEKICK_TMUXBACKEND_H

#include "sidekick_export.h"

#include "SessionBackend.h"
#include "Tool.h"

#include <QList>
#include <QString>
#include <QStringList>
#include <QTimer>

#include <functional>

namespace Sidekick
{

/**
 * TmuxBackend hosts a tool inside a detached tmux session.
 *
 * The tmux session outlives Sidekick, so a later run can rediscover it
 * (see listPanes() and Session::discover()) and attach again.
 *
 * Session naming convention: sidekick-{tool}-{8-char-id}
 */
class SIDEKICK_EXPORT TmuxBackend : public SessionBackend
{
    Q_OBJECT

public:
    /**
     * A pane and the PID of the process it runs
     */
    struct PaneInfo {
        QString sessionName;
        qint64 pid = 0;
    };

    /**
     * Backend for a new tmux session running the tool
     */
    explicit TmuxBackend(const Tool &tool, QObject *parent = nullptr);

    /**
     * Backend bound to an already running tmux session. It counts as alive
     * only if the session exists at that point.
     */
    static TmuxBackend *createForExisting(const Tool &tool, const QString &sessionName, QObject *parent = nullptr);

    ~TmuxBackend() override;

    /**
     * Check if tmux is available on the system
     */
    static bool isAvailable();

    /**
     * Generate a unique session ID (8 hex characters)
     */
    static QString generateSessionId();

    /**
     * "sidekick-{tool}-{id}", with characters tmux rejects replaced
     */
    static QString buildSessionName(const QString &toolName, const QString &sessionId);

    /**
     * Split a "sidekick-{tool}-{id}" name. Returns false for foreign names.
     */
    static bool parseSessionName(const QString &sessionName, QString *toolName, QString *sessionId);

    /**
     * Arguments for "tmux new-session" starting the tool detached
     */
    QStringList buildNewSessionArgs(const QString &workingDir = QString()) const;

    QString buildAttachCommand() const;

    /**
     * List all panes of all sessions
     */
    static QList<PaneInfo> listPanes();

    static QList<PaneInfo> parsePaneList(const QString &output);

    /**
     * Ask tmux whether the session exists (blocking)
     */
    bool sessionExists() const;

    /**
     * Paste literal text into the pane (bracketed paste when supported)
     */
    bool pasteText(const QString &text);

    /**
     * Send a tmux key name (Enter, C-c, ...)
     */
    bool sendKeySequence(const QString &keyName);

    /**
     * Capture pane content
     */
    void capturePaneAsync(std::function<void(bool, const QString &)> callback);

    // SessionBackend
    QString name() const override
    {
        return QStringLiteral("tmux");
    }
    QString sessionId() const override
    {
        return m_sessionName;
    }
    bool start() override;
    bool isAlive() const override
    {
        return m_running;
    }
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
        return m_ready;
    }
    QString attachCommand() const override
    {
        return buildAttachCommand();
    }

Q_SIGNALS:
    /**
     * Emitted when an error occurs during tmux operations
     */
    void errorOccurred(const QString &message);

private:
    TmuxBackend(const Tool &tool, const QString &sessionName, QObject *parent);

    /**
     * Run tmux synchronously, optionally feeding stdin
     */
    static QString runTmux(const QStringList &args, bool *ok, const QByteArray &input = QByteArray(), QString *errorOutput = nullptr);

    /**
     * Execute a tmux command and report failures through errorOccurred
     */
    QString executeCommand(const QStringList &args, bool *ok = nullptr, const QByteArray &input = QByteArray()) const;
    void executeCommandAsync(const QStringList &args, std::function<void(bool, const QString &)> callback, bool reportErrors = true);

    void startMonitoring();
    void pollReady();
    void pollAlive();
    void setReady();

    /**
     * Targets matching this session only, never by prefix or pattern
     */
    QString sessionTarget() const;
    QString paneTarget() const;

    Tool m_tool;
    QString m_sessionName;
    bool m_ready = false;
    bool m_running = false;
    int m_readyPolls = 0;

    QTimer *m_readyTimer = nullptr;
    QTimer *m_aliveTimer = nullptr;

    static constexpr int READY_POLL_INTERVAL_MS = 250;
    static constexpr int READY_POLL_LIMIT = 120; // 30 seconds
    static constexpr int ALIVE_POLL_INTERVAL_MS = 2000;
};

} // namespace Sidekick

#endif // SIDEKICK_TMUXBACKEND_H
