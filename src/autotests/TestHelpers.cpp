/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TestHelpers.h"

#include "../cli/Session.h"
#include "../cli/State.h"
#include "../cli/TmuxBackend.h"

namespace Sidekick
{

FakeBackend::FakeBackend(const QString &id, QObject *parent)
    : SessionBackend(parent)
    , m_id(id.isEmpty() ? TmuxBackend::generateSessionId() : id)
{
}

FakeBackend::~FakeBackend() = default;

QList<QPointer<FakeBackend>> &FakeBackend::created()
{
    static QList<QPointer<FakeBackend>> backends;
    return backends;
}

void FakeBackend::registerFactory(bool withReadySignal)
{
    Session::registerBackend(QStringLiteral("fake"), [withReadySignal](const Tool &, QObject *parent) -> SessionBackend * {
        auto *backend = new FakeBackend(QString(), parent);
        backend->withReadySignal = withReadySignal;
        created().append(backend);
        return backend;
    });
}

bool FakeBackend::start()
{
    ++startCount;
    if (failStart) {
        return false;
    }
    alive = true;
    return true;
}

bool FakeBackend::send(const QString &text)
{
    if (!alive) {
        return false;
    }
    sends.append(text);
    operations.append(QStringLiteral("send:") + text);
    return true;
}

bool FakeBackend::submit()
{
    if (!alive) {
        return false;
    }
    ++submitCount;
    operations.append(QStringLiteral("submit"));
    return true;
}

void FakeBackend::detach()
{
    ++detachCount;
    if (stopOnDetach) {
        alive = false;
    }
}

void FakeBackend::becomeReady()
{
    readyNow = true;
    Q_EMIT ready();
}

void FakeBackend::die()
{
    alive = false;
    Q_EMIT exited();
}

void RecordingHost::notify(Level level, const QString &message)
{
    notices.append(qMakePair(level, message));
}

void RecordingHost::exitVisualMode()
{
    ++exitVisualModeCount;
    visualMode = false;
}

std::optional<Text> RecordingHost::contextValue(const QString &name) const
{
    auto it = values.constFind(name);
    if (it != values.constEnd()) {
        return it.value();
    }
    return Host::contextValue(name);
}

bool RecordingHost::isExecutable(const QString &command) const
{
    return executables.contains(command);
}

void RecordingHost::onMissing(const Tool &tool)
{
    missing.append(tool.name);
    Host::onMissing(tool);
}

void RecordingHost::selectPrompt(const QStringList &prompts, const PromptCallback &callback)
{
    offeredPrompts = prompts;
    callback(promptChoice);
}

void RecordingHost::selectSession(const QList<State *> &states, const QStringList &tools, const SelectionCallback &callback)
{
    ++selectSessionCount;
    offeredTools = tools;

    Selection selection;
    if (pickFirstState && !states.isEmpty()) {
        selection.state = states.first();
    } else {
        selection.toolName = toolChoice;
    }
    callback(selection);
}

int RecordingHost::count(Level level) const
{
    int n = 0;
    for (const auto &notice : notices) {
        if (notice.first == level) {
            ++n;
        }
    }
    return n;
}

bool RecordingHost::hasNotice(Level level, const QString &needle) const
{
    for (const auto &notice : notices) {
        if (notice.first == level && notice.second.contains(needle)) {
            return true;
        }
    }
    return false;
}

Tool makeTool(const QString &name)
{
    Tool tool;
    tool.name = name;
    tool.cmd = QStringList{name};
    return tool;
}

Session *makeSession(const QString &toolName, const QString &id, bool alive)
{
    auto *backend = new FakeBackend(id);
    backend->alive = alive;
    return new Session(makeTool(toolName), backend);
}

} // namespace Sidekick

#include "moc_TestHelpers.cpp"
