/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SIDEKICK_TESTHELPERS_H
#define SIDEKICK_TESTHELPERS_H

#include <QList>
#include <QMap>
#include <QPair>
#include <QPointer>
#include <QStringList>

#include "../cli/Host.h"
#include "../cli/SessionBackend.h"
#include "../cli/Tool.h"

namespace Sidekick
{

class Session;

/**
 * In-memory backend recording everything sent to it
 */
class FakeBackend : public SessionBackend
{
    Q_OBJECT

public:
    explicit FakeBackend(const QString &id = QString(), QObject *parent = nullptr);
    ~FakeBackend() override;

    /**
     * Every FakeBackend created by the "fake" backend factory
     */
    static QList<QPointer<FakeBackend>> &created();

    /**
     * Register the "fake" backend with Session. Backends it creates
     * announce readiness only through becomeReady() when withReadySignal
     * is set.
     */
    static void registerFactory(bool withReadySignal = false);

    QString name() const override
    {
        return QStringLiteral("fake");
    }
    QString sessionId() const override
    {
        return m_id;
    }
    bool start() override;
    bool isAlive() const override
    {
        return alive;
    }
    bool send(const QString &text) override;
    bool submit() override;
    void detach() override;
    qint64 pid() const override
    {
        return 0;
    }
    bool hasReadySignal() const override
    {
        return withReadySignal;
    }
    bool isReady() const override
    {
        return withReadySignal ? readyNow : alive;
    }

    void becomeReady();
    void die();

    QStringList sends;
    QStringList operations; // "send:TEXT" and "submit" in call order
    int submitCount = 0;
    int startCount = 0;
    int detachCount = 0;
    bool alive = false;
    bool withReadySignal = false;
    bool readyNow = false;
    bool failStart = false;
    bool stopOnDetach = false;

private:
    QString m_id;
};

/**
 * Host recording notices and answering pickers from preset choices
 */
class RecordingHost : public Host
{
public:
    void notify(Level level, const QString &message) override;
    bool isVisualMode() const override
    {
        return visualMode;
    }
    void exitVisualMode() override;
    std::optional<Text> contextValue(const QString &name) const override;
    bool isExecutable(const QString &command) const override;
    void onMissing(const Tool &tool) override;
    void selectPrompt(const QStringList &prompts, const PromptCallback &callback) override;
    void selectSession(const QList<State *> &states, const QStringList &tools, const SelectionCallback &callback) override;

    int count(Level level) const;
    bool hasNotice(Level level, const QString &needle) const;

    QList<QPair<Level, QString>> notices;
    bool visualMode = false;
    int exitVisualModeCount = 0;
    QMap<QString, Text> values;
    QStringList executables;
    QStringList missing;

    QString promptChoice;
    QStringList offeredPrompts;

    QString toolChoice;           // picked when no State is offered
    bool pickFirstState = true;
    int selectSessionCount = 0;
    QStringList offeredTools;
};

/**
 * A tool whose executable is its name
 */
Tool makeTool(const QString &name);

/**
 * A Session on a FakeBackend that is already running
 */
Session *makeSession(const QString &toolName, const QString &id, bool alive = true);

} // namespace Sidekick

#endif // SIDEKICK_TESTHELPERS_H
