/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SIDEKICK_HOST_H
#define SIDEKICK_HOST_H

#include "sidekick_export.h"

#include "Text.h"

#include <QList>
#include <QPointer>
#include <QString>
#include <QStringList>

#include <functional>
#include <optional>

namespace Sidekick
{

class State;
struct Tool;

/**
 * Host is the environment Sidekick is embedded in (an editor, an IDE
 * plugin, the sidekick command line tool).
 *
 * Every method has a headless default. Embedders override what their
 * environment provides: notifications, the current selection, pickers.
 */
class SIDEKICK_EXPORT Host
{
public:
    enum class Level {
        Info,
        Warning,
        Error
    };

    /**
     * Result of the session picker: an existing State, or the name of a
     * tool to start a new session of. Both empty when cancelled.
     */
    struct Selection {
        QPointer<State> state;
        QString toolName;
    };

    using PromptCallback = std::function<void(const QString &promptName)>;
    using SelectionCallback = std::function<void(const Selection &selection)>;

    Host();
    virtual ~Host();

    /**
     * Show a message to the user
     */
    virtual void notify(Level level, const QString &message);

    /**
     * Whether the user currently has text selected
     */
    virtual bool isVisualMode() const;
    virtual void exitVisualMode();

    /**
     * Value of a {placeholder} in a message, nullopt if unknown.
     * The default knows "cwd".
     */
    virtual std::optional<Text> contextValue(const QString &name) const;

    /**
     * Whether a command can be run
     */
    virtual bool isExecutable(const QString &command) const;

    /**
     * A tool is not installed. The default reports where to get it.
     */
    virtual void onMissing(const Tool &tool);

    /**
     * Let the user pick one of the prompts. The default picks nothing.
     */
    virtual void selectPrompt(const QStringList &prompts, const PromptCallback &callback);

    /**
     * Let the user pick a running session or a tool to start.
     * The default picks the first State, else the first tool.
     */
    virtual void selectSession(const QList<State *> &states, const QStringList &tools, const SelectionCallback &callback);
};

} // namespace Sidekick

#endif // SIDEKICK_HOST_H
