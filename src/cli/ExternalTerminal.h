/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SIDEKICK_EXTERNALTERMINAL_H
#define SIDEKICK_EXTERNALTERMINAL_H

#include "sidekick_export.h"

#include "Terminal.h"

#include <QProcess>
#include <QStringList>

namespace Sidekick
{

/**
 * ExternalTerminal shows a session in a terminal emulator window
 * running the backend's attach command.
 *
 * Hiding closes the window only; a tmux session keeps running and can
 * be shown again later.
 */
class SIDEKICK_EXPORT ExternalTerminal : public Terminal
{
    Q_OBJECT

public:
    /**
     * @param terminalCommand emulator prefix, e.g. "konsole -e"
     */
    ExternalTerminal(Session *session, const QString &terminalCommand, QObject *parent = nullptr);
    ~ExternalTerminal() override;

    /**
     * Full command line the emulator is started with,
     * empty if the session cannot be attached from outside
     */
    QStringList launchArguments() const;

protected:
    bool openView() override;
    void closeView() override;

private:
    QString m_terminalCommand;
    QProcess *m_process = nullptr;
};

} // namespace Sidekick

#endif // SIDEKICK_EXTERNALTERMINAL_H
