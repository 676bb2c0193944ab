/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SIDEKICK_STATEREGISTRY_H
#define SIDEKICK_STATEREGISTRY_H

#include "sidekick_export.h"

#include "State.h"

#include <QList>
#include <QObject>
#include <QString>

#include <functional>
#include <optional>

namespace Sidekick
{

class Session;
class Terminal;
class ToolRegistry;

/**
 * StateRegistry tracks every State known to one Cli.
 *
 * States are kept in creation order. All mutation happens on the
 * thread owning the registry.
 */
class SIDEKICK_EXPORT StateRegistry : public QObject
{
    Q_OBJECT

public:
    using TerminalFactory = std::function<Terminal *(Session *session, QObject *parent)>;

    /**
     * Action run by with(). state is nullptr when nothing matched (only
     * with attach set). attached tells if with() attached the State just
     * now. Returns false on failure.
     */
    using Action = std::function<bool(State *state, bool attached)>;

    struct AttachOptions {
        bool show = false;
        std::optional<bool> focus;
    };

    struct WithOptions {
        Filter filter;
        bool all = false;     // act on every match instead of the first one
        bool attach = false;  // attach un-attached matches first
        bool show = false;    // make sure the terminal is visible
        std::optional<bool> focus;
    };

    explicit StateRegistry(QObject *parent = nullptr);
    ~StateRegistry() override;

    /**
     * How terminals are created, defaults to a plain Terminal
     */
    void setTerminalFactory(const TerminalFactory &factory);

    /**
     * States matching filter, in creation order
     */
    QList<State *> get(const Filter &filter = Filter()) const;

    QList<State *> states() const
    {
        return m_states;
    }

    int count() const
    {
        return m_states.size();
    }

    bool contains(const State *state) const;

    /**
     * State of a session id, nullptr if unknown
     */
    State *find(const QString &sessionId) const;

    /**
     * The State of a session, registered on first use. If another
     * Session with the same id is already known, session is deleted
     * and the existing State is returned.
     */
    State *stateFor(Session *session);

    /**
     * Bind a State: start its process if needed and create its terminal.
     * Returns false if the process could not be started.
     */
    bool attach(State *state, const AttachOptions &options = AttachOptions());

    /**
     * Remove a State, release its session and close its terminal.
     * Safe to call more than once.
     */
    bool detach(State *state);

    /**
     * Pick up multiplexer sessions running a known tool and drop
     * un-attached States whose process has exited.
     */
    void refresh(const ToolRegistry &tools);

    /**
     * Resolve States by options.filter and run action on them.
     * Returns the States the action succeeded for.
     */
    QList<State *> with(const Action &action, const WithOptions &options);

Q_SIGNALS:
    void stateAdded(State *state);
    void stateRemoved(const QString &sessionId);

private:
    Terminal *ensureTerminal(State *state);

    QList<State *> m_states;
    TerminalFactory m_terminalFactory;
};

} // namespace Sidekick

#endif // SIDEKICK_STATEREGISTRY_H
