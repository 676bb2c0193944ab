/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "Host.h"
#include "State.h"
#include "Tool.h"

#include <QDebug>
#include <QDir>
#include <QStandardPaths>

#include <KLocalizedString>

namespace Sidekick
{

Host::Host() = default;

Host::~Host() = default;

void Host::notify(Level level, const QString &message)
{
    switch (level) {
    case Level::Info:
        qInfo().noquote() << message;
        break;
    case Level::Warning:
        qWarning().noquote() << message;
        break;
    case Level::Error:
        qCritical().noquote() << message;
        break;
    }
}

bool Host::isVisualMode() const
{
    return false;
}

void Host::exitVisualMode()
{
}

std::optional<Text> Host::contextValue(const QString &name) const
{
    if (name == QLatin1String("cwd")) {
        return textFromString(QDir::currentPath(), TextChunk::Kind::File);
    }
    return std::nullopt;
}

bool Host::isExecutable(const QString &command) const
{
    if (command.isEmpty()) {
        return false;
    }
    return !QStandardPaths::findExecutable(command).isEmpty();
}

void Host::onMissing(const Tool &tool)
{
    QString message = i18n("%1 is not installed (%2 not found).", tool.name, tool.executable());
    if (!tool.url.isEmpty()) {
        message += QLatin1Char(' ') + i18n("See %1", tool.url);
    }
    notify(Level::Error, message);
}

void Host::selectPrompt(const QStringList &prompts, const PromptCallback &callback)
{
    Q_UNUSED(prompts)
    if (callback) {
        callback(QString());
    }
}

void Host::selectSession(const QList<State *> &states, const QStringList &tools, const SelectionCallback &callback)
{
    if (!callback) {
        return;
    }
    Selection selection;
    if (!states.isEmpty()) {
        selection.state = states.first();
    } else if (!tools.isEmpty()) {
        selection.toolName = tools.first();
    }
    callback(selection);
}

} // namespace Sidekick
