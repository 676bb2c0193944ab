/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SIDEKICK_TOOLREGISTRY_H
#define SIDEKICK_TOOLREGISTRY_H

#include "sidekick_export.h"

#include "Tool.h"

#include <QList>
#include <QMap>
#include <QString>
#include <QStringList>

#include <KSharedConfig>

namespace Sidekick
{

/**
 * Catalogue of known CLI tools.
 *
 * Starts with the built-in definitions; load() applies [Tool NAME]
 * groups from the config on top of them:
 *
 *   [Tool claude]
 *   Cmd=claude,--continue
 *   Env=FOO=bar,!NO_COLOR
 *   IsProc=\\bclaude\\b
 *   Url=https://...
 *   MuxFocus=false
 *   NativeScroll=false
 *   Enabled=true
 */
class SIDEKICK_EXPORT ToolRegistry
{
public:
    ToolRegistry();

    static QList<Tool> builtinTools();

    /**
     * Apply config overrides. Tools named in the config but unknown
     * are added if they define a Cmd.
     */
    void load(const KSharedConfig::Ptr &config);

    /**
     * Look up a tool by name, nullptr if unknown
     */
    const Tool *tool(const QString &name) const;

    QList<Tool> tools() const
    {
        return m_tools.values();
    }

    QStringList names() const
    {
        return m_tools.keys();
    }

    /**
     * Add or replace a tool definition
     */
    void addTool(const Tool &tool);

    void removeTool(const QString &name);

private:
    static Tool makeTool(const QString &name, const QStringList &cmd, const QString &url);

    QMap<QString, Tool> m_tools;
};

} // namespace Sidekick

#endif // SIDEKICK_TOOLREGISTRY_H
