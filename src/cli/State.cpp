/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "State.h"
#include "Session.h"
#include "Terminal.h"

#include <QDebug>

namespace Sidekick
{

State::State(Session *session, QObject *parent)
    : QObject(parent)
    , m_session(session)
{
    Q_ASSERT(session);
    session->setParent(this);

    connect(session, &Session::exited, this, [this]() {
        if (!m_attached) {
            return;
        }
        qDebug() << "State:" << sessionId() << "lost its process";
        m_attached = false;
        Q_EMIT detached();
    });
}

State::~State() = default;

const Tool &State::tool() const
{
    return m_session->tool();
}

QString State::name() const
{
    return m_session ? m_session->toolName() : QString();
}

QString State::sessionId() const
{
    return m_session ? m_session->id() : QString();
}

bool State::isAttached() const
{
    return m_attached && m_session && m_session->isAlive();
}

void State::setTerminal(Terminal *terminal)
{
    if (m_terminal == terminal) {
        return;
    }
    if (m_terminal) {
        m_terminal->close();
        m_terminal->deleteLater();
    }
    m_terminal = terminal;
    if (m_terminal) {
        m_terminal->setParent(this);
    }
}

void State::setAttached(bool attached)
{
    m_attached = attached;
}

bool Filter::matches(const State *state) const
{
    if (!state) {
        return false;
    }
    if (name && state->name() != *name) {
        return false;
    }
    if (session && state->sessionId() != *session) {
        return false;
    }
    if (terminal && (state->terminal() != nullptr) != *terminal) {
        return false;
    }
    // Last, this one may ask the backend
    if (attached && state->isAttached() != *attached) {
        return false;
    }
    return true;
}

Filter Filter::merged(const Filter &other) const
{
    Filter result = *this;
    if (other.name) {
        result.name = other.name;
    }
    if (other.attached) {
        result.attached = other.attached;
    }
    if (other.terminal) {
        result.terminal = other.terminal;
    }
    if (other.session) {
        result.session = other.session;
    }
    return result;
}

} // namespace Sidekick

#include "moc_State.cpp"
