/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SIDEKICK_TERMINAL_H
#define SIDEKICK_TERMINAL_H

#include "sidekick_export.h"

#include <QObject>
#include <QPointer>

namespace Sidekick
{

class Session;

/**
 * Terminal is the view a user looks at a Session through.
 *
 * The base class only tracks open/focused state. Embedders render the
 * session by overriding the view hooks, which are called only when the
 * state actually changes, so every public call is idempotent.
 */
class SIDEKICK_EXPORT Terminal : public QObject
{
    Q_OBJECT

public:
    explicit Terminal(Session *session, QObject *parent = nullptr);
    ~Terminal() override;

    Session *session() const
    {
        return m_session;
    }

    bool isOpen() const
    {
        return m_open;
    }

    bool isFocused() const
    {
        return m_focused;
    }

    void show();
    void hide();

    /**
     * Closed: open and focus. Open: hide.
     */
    void toggle();

    /**
     * Give input focus, opening the terminal first if needed
     */
    void focus();
    void blur();

    /**
     * Hide and release the view for good
     */
    void close();

Q_SIGNALS:
    void opened();
    void hidden();
    void focused();
    void blurred();

protected:
    /**
     * View hooks. openView() returns false if no view could be created,
     * the terminal then stays closed.
     */
    virtual bool openView();
    virtual void closeView();
    virtual void focusView();
    virtual void blurView();

    /**
     * For subclasses whose view went away on its own
     */
    void markClosed();

private:
    QPointer<Session> m_session;
    bool m_open = false;
    bool m_focused = false;
    bool m_closed = false;
};

} // namespace Sidekick

#endif // SIDEKICK_TERMINAL_H
