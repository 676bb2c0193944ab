/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SIDEKICK_STATE_H
#define SIDEKICK_STATE_H

#include "sidekick_export.h"

#include "Tool.h"

#include <QObject>
#include <QPointer>
#include <QString>

#include <optional>

namespace Sidekick
{

class Session;
class StateRegistry;
class Terminal;

/**
 * State binds a Tool, the Session running it and the Terminal showing it.
 * It is the unit every Cli command addresses.
 *
 * States are owned by a StateRegistry, one State per session id.
 */
class SIDEKICK_EXPORT State : public QObject
{
    Q_OBJECT

public:
    /**
     * Takes ownership of the session
     */
    explicit State(Session *session, QObject *parent = nullptr);
    ~State() override;

    const Tool &tool() const;

    /**
     * Tool name, what Filter::name matches
     */
    QString name() const;
    QString sessionId() const;

    Session *session() const
    {
        return m_session;
    }

    /**
     * nullptr until the first show or attach
     */
    Terminal *terminal() const
    {
        return m_terminal;
    }

    /**
     * Bound through attach and the process is still running
     */
    bool isAttached() const;

Q_SIGNALS:
    /**
     * The session process went away while attached
     */
    void detached();

private:
    friend class StateRegistry;

    void setTerminal(Terminal *terminal);
    void setAttached(bool attached);

    QPointer<Session> m_session;
    QPointer<Terminal> m_terminal;
    bool m_attached = false;
};

/**
 * Filter selects States. Every field that is set must match.
 */
struct SIDEKICK_EXPORT Filter {
    std::optional<QString> name;     // tool name
    std::optional<bool> attached;
    std::optional<bool> terminal;    // has a Terminal (open or not)
    std::optional<QString> session;  // exact session id

    bool matches(const State *state) const;

    bool isEmpty() const
    {
        return !name && !attached && !terminal && !session;
    }

    /**
     * Copy of this filter with the fields set in other overriding
     */
    Filter merged(const Filter &other) const;
};

} // namespace Sidekick

#endif // SIDEKICK_STATE_H
