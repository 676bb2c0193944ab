/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SIDEKICK_CLI_H
#define SIDEKICK_CLI_H

#include "sidekick_export.h"

#include "Context.h"
#include "PromptLibrary.h"
#include "State.h"
#include "StateRegistry.h"
#include "ToolRegistry.h"

#include <QObject>
#include <QString>

#include <functional>
#include <optional>

namespace Sidekick
{

class Host;
class SidekickSettings;

/**
 * Cli is the command surface for driving CLI tool sessions.
 *
 * Every command takes an options struct; most also accept a bare tool
 * name (or message, for send) as shorthand. A name is folded into the
 * filter before anything else happens.
 */
class SIDEKICK_EXPORT Cli : public QObject
{
    Q_OBJECT

public:
    struct NewOptions {
        QString name;     // tool, defaults to the configured default tool
        std::optional<bool> focus;
        QString backend;  // defaults to the configured backend
    };

    struct ShowOptions {
        QString name;
        Filter filter;
        std::optional<bool> focus;
        bool all = false;
    };

    struct HideOptions {
        QString name;
        Filter filter;
        bool all = false;
    };

    struct SendOptions {
        QString name;
        Filter filter;
        Message message;
        bool submit = false;
        std::optional<bool> focus;
    };

    /**
     * Called with the rendered prompt, text is nullopt if it rendered empty
     */
    using PromptCallback = std::function<void(const QString &msg, const std::optional<Text> &text)>;

    struct PromptOptions {
        QString name;     // tool the prompt goes to
        std::optional<bool> focus;
        PromptCallback callback; // defaults to sending the prompt
    };

    using SelectCallback = std::function<void(State *state)>;

    struct SelectOptions {
        Filter filter;
        std::optional<bool> focus;
        SelectCallback callback; // defaults to attaching and showing
    };

    /**
     * host and settings must outlive the Cli
     */
    Cli(Host *host, SidekickSettings *settings, QObject *parent = nullptr);
    ~Cli() override;

    Host *host() const
    {
        return m_host;
    }

    SidekickSettings *settings() const
    {
        return m_settings;
    }

    StateRegistry *registry() const
    {
        return m_registry;
    }

    const ToolRegistry &tools() const
    {
        return m_tools;
    }

    const PromptLibrary &prompts() const
    {
        return m_prompts;
    }

    /**
     * Re-read tool and prompt definitions from the settings
     */
    void reload();

    /**
     * Pick up tool sessions that are already running
     */
    void refresh();

    /**
     * Start a new session and attach it. Returns nullptr if the tool is
     * unknown, not installed or could not be started.
     */
    State *newSession(const QString &name = QString());
    State *newSession(const NewOptions &options);

    void show(const QString &name);
    void show(const ShowOptions &options = ShowOptions());

    void hide(const QString &name);
    void hide(const HideOptions &options = HideOptions());

    /**
     * Show and focus a hidden terminal, hide an open one
     */
    void toggle(const QString &name);
    void toggle(const ShowOptions &options = ShowOptions());

    /**
     * Focus the terminal, or give focus back if it already has it
     */
    void focus(const QString &name);
    void focus(const ShowOptions &options = ShowOptions());

    /**
     * Detach sessions: terminals close, tmux sessions keep running,
     * direct child processes end.
     */
    void close(const QString &name);
    void close(const HideOptions &options = HideOptions());

    /**
     * Send a message to a session, opening the session picker if none
     * matches.
     */
    void send(const QString &msg);
    void send(const SendOptions &options);

    /**
     * Like send(), but starts a session of the named tool first if none
     * is attached
     */
    void mySend(const QString &msg);
    void mySend(const SendOptions &options);

    /**
     * Let the user pick a prompt, then send it
     */
    void prompt(const PromptCallback &callback);
    void prompt(const PromptOptions &options = PromptOptions());

    /**
     * Like prompt(), but starts a session first if none is attached
     */
    void myPrompt(const PromptOptions &options = PromptOptions());

    /**
     * Let the user pick a session or a tool to start
     */
    void select(const SelectCallback &callback);
    void select(const SelectOptions &options = SelectOptions());

    Context::Rendered render(const QString &templateText) const;
    Context::Rendered render(const Message &message) const;

    /**
     * @deprecated use prompt()
     */
    void selectPrompt(const PromptOptions &options = PromptOptions());

    /**
     * @deprecated use select()
     */
    void selectTool(const SelectOptions &options = SelectOptions());

    /**
     * @deprecated use send()
     */
    void ask(const QString &msg);
    void ask(const SendOptions &options);

Q_SIGNALS:
    /**
     * A message was handed to a session
     */
    void delivered(const QString &sessionId, const QString &payload);

private:
    static Filter normalized(const QString &name, const Filter &filter);

    /**
     * Send on the next event loop turn, if the State is still around
     */
    void deliver(State *state, const Text &text, bool submit);

    void deprecate(const QString &oldName, const QString &newName);

    Host *m_host = nullptr;
    SidekickSettings *m_settings = nullptr;
    ToolRegistry m_tools;
    PromptLibrary m_prompts;
    Context m_context;
    StateRegistry *m_registry = nullptr;
};

} // namespace Sidekick

#endif // SIDEKICK_CLI_H
