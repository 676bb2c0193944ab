/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "StateRegistry.h"
#include "Session.h"
#include "Terminal.h"
#include "ToolRegistry.h"

#include <QDebug>
#include <QPointer>

#include <exception>

namespace Sidekick
{

StateRegistry::StateRegistry(QObject *parent)
    : QObject(parent)
{
    m_terminalFactory = [](Session *session, QObject *parent) -> Terminal * {
        return new Terminal(session, parent);
    };
}

StateRegistry::~StateRegistry()
{
    // States are children, only release the processes here
    const QList<State *> states = m_states;
    m_states.clear();
    for (State *state : states) {
        if (state->session()) {
            state->session()->detach();
        }
    }
}

void StateRegistry::setTerminalFactory(const TerminalFactory &factory)
{
    if (factory) {
        m_terminalFactory = factory;
    }
}

QList<State *> StateRegistry::get(const Filter &filter) const
{
    QList<State *> result;
    for (State *state : m_states) {
        if (filter.matches(state)) {
            result.append(state);
        }
    }
    return result;
}

bool StateRegistry::contains(const State *state) const
{
    return state && m_states.contains(const_cast<State *>(state));
}

State *StateRegistry::find(const QString &sessionId) const
{
    for (State *state : m_states) {
        if (state->sessionId() == sessionId) {
            return state;
        }
    }
    return nullptr;
}

State *StateRegistry::stateFor(Session *session)
{
    if (!session) {
        return nullptr;
    }

    if (State *existing = find(session->id())) {
        if (existing->session() != session) {
            session->deleteLater();
        }
        return existing;
    }

    auto *state = new State(session, this);
    m_states.append(state);
    qDebug() << "StateRegistry: registered" << state->name() << state->sessionId();
    Q_EMIT stateAdded(state);
    return state;
}

Terminal *StateRegistry::ensureTerminal(State *state)
{
    if (!state->terminal()) {
        state->setTerminal(m_terminalFactory(state->session(), state));
    }
    return state->terminal();
}

bool StateRegistry::attach(State *state, const AttachOptions &options)
{
    if (!contains(state)) {
        return false;
    }

    Session *session = state->session();
    if (!session->isAlive() && !session->start()) {
        qWarning() << "StateRegistry: could not start" << state->name() << state->sessionId();
        return false;
    }

    state->setAttached(true);

    Terminal *terminal = ensureTerminal(state);
    if (options.show) {
        terminal->show();
    }
    if (options.focus.value_or(false)) {
        terminal->focus();
    }
    return true;
}

bool StateRegistry::detach(State *state)
{
    if (!contains(state)) {
        return false;
    }

    const QString sessionId = state->sessionId();
    m_states.removeOne(state);
    state->setAttached(false);

    if (state->terminal()) {
        state->terminal()->close();
    }
    if (state->session()) {
        state->session()->detach();
    }

    qDebug() << "StateRegistry: detached" << state->name() << sessionId;
    Q_EMIT stateRemoved(sessionId);
    state->deleteLater();
    return true;
}

void StateRegistry::refresh(const ToolRegistry &tools)
{
    QStringList known;
    for (State *state : std::as_const(m_states)) {
        known.append(state->sessionId());
    }

    const QList<Session *> found = Session::discover(tools, known, this);
    for (Session *session : found) {
        stateFor(session);
    }

    const QList<State *> states = m_states;
    for (State *state : states) {
        if (!state->m_attached && !state->session()->isAlive()) {
            detach(state);
        }
    }
}

QList<State *> StateRegistry::with(const Action &action, const WithOptions &options)
{
    QList<State *> done;
    if (!action) {
        return done;
    }

    QList<State *> matches = get(options.filter);
    if (matches.isEmpty()) {
        if (options.attach) {
            try {
                action(nullptr, false);
            } catch (const std::exception &e) {
                qWarning() << "StateRegistry: action failed:" << e.what();
            }
        }
        return done;
    }
    if (!options.all) {
        matches = matches.mid(0, 1);
    }

    // An action may detach States further down the list
    QList<QPointer<State>> targets;
    for (State *state : std::as_const(matches)) {
        targets.append(state);
    }

    for (const QPointer<State> &state : std::as_const(targets)) {
        if (!state || !contains(state)) {
            continue;
        }

        bool attached = false;
        if (options.attach && !state->isAttached()) {
            AttachOptions attachOptions;
            attachOptions.show = options.show;
            if (!attach(state, attachOptions)) {
                continue;
            }
            attached = true;
        } else if (options.show) {
            ensureTerminal(state)->show();
        }

        bool ok = false;
        try {
            ok = action(state, attached);
        } catch (const std::exception &e) {
            qWarning() << "StateRegistry: action failed for" << state->sessionId() << ":" << e.what();
        }
        if (ok) {
            done.append(state);
        }

        if (options.focus.value_or(false) && contains(state) && state->terminal()) {
            state->terminal()->focus();
        }
    }

    return done;
}

} // namespace Sidekick

#include "moc_StateRegistry.cpp"
