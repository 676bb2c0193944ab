/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SIDEKICK_TOOL_H
#define SIDEKICK_TOOL_H

#include "sidekick_export.h"

#include "ProcessTable.h"
#include "Text.h"

#include <QMap>
#include <QRegularExpression>
#include <QString>
#include <QStringList>

#include <functional>
#include <optional>

class QProcessEnvironment;

namespace Sidekick
{

/**
 * Tool describes an external CLI assistant that Sidekick can drive.
 *
 * Tools are looked up by name from the ToolRegistry and are never
 * modified once the registry has been loaded.
 */
struct SIDEKICK_EXPORT Tool {
    using ProcPredicate = std::function<bool(const Tool &tool, const ProcInfo &proc)>;
    using Formatter = std::function<QString(const Text &text)>;

    QString name;
    QStringList cmd;                             // launch command, cmd[0] is the executable
    QMap<QString, std::optional<QString>> env;   // nullopt = unset the variable
    QString url;                                 // shown when the tool is not installed
    QString isProcPattern;                       // regex matched against the process command line
    ProcPredicate isProcFunction;                // takes precedence over isProcPattern
    bool muxFocus = false;                       // multiplexer pane must be focused to receive input
    Formatter formatter;                         // defaults to textToString()
    bool nativeScroll = false;

    bool isValid() const
    {
        return !name.isEmpty() && !cmd.isEmpty();
    }

    /**
     * Executable name (first element of the launch command)
     */
    QString executable() const
    {
        return cmd.isEmpty() ? QString() : cmd.first();
    }

    /**
     * Whether a live process belongs to this tool
     */
    bool isProc(const ProcInfo &proc) const;

    /**
     * Render structured text into the literal string sent to the process
     */
    QString format(const Text &text) const;

    /**
     * Apply env overrides to a process environment
     */
    void applyEnvironment(QProcessEnvironment &environment) const;

    /**
     * Identification pattern used when isProcPattern is empty:
     * the executable basename as a whole word.
     */
    QString defaultProcPattern() const;
};

} // namespace Sidekick

#endif // SIDEKICK_TOOL_H
