/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "Terminal.h"
#include "Session.h"

#include <QDebug>

namespace Sidekick
{

Terminal::Terminal(Session *session, QObject *parent)
    : QObject(parent)
    , m_session(session)
{
}

Terminal::~Terminal() = default;

void Terminal::show()
{
    if (m_open || m_closed) {
        return;
    }
    if (!openView()) {
        qWarning() << "Terminal: could not open a view for" << (m_session ? m_session->id() : QString());
        return;
    }
    m_open = true;
    Q_EMIT opened();
}

void Terminal::hide()
{
    if (!m_open) {
        return;
    }
    blur();
    closeView();
    m_open = false;
    Q_EMIT hidden();
}

void Terminal::toggle()
{
    if (m_open) {
        hide();
    } else {
        show();
        focus();
    }
}

void Terminal::focus()
{
    if (m_focused) {
        return;
    }
    show();
    if (!m_open) {
        return;
    }
    focusView();
    m_focused = true;
    Q_EMIT focused();
}

void Terminal::blur()
{
    if (!m_focused) {
        return;
    }
    blurView();
    m_focused = false;
    Q_EMIT blurred();
}

void Terminal::close()
{
    hide();
    m_closed = true;
}

bool Terminal::openView()
{
    return true;
}

void Terminal::closeView()
{
}

void Terminal::focusView()
{
}

void Terminal::blurView()
{
}

void Terminal::markClosed()
{
    if (!m_open) {
        return;
    }
    m_focused = false;
    m_open = false;
    Q_EMIT hidden();
}

} // namespace Sidekick

#include "moc_Terminal.cpp"
