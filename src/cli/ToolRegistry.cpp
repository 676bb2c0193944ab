/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ToolRegistry.h"

#include <QDebug>

#include <KConfigGroup>

namespace Sidekick
{

static const QString s_toolGroupPrefix = QStringLiteral("Tool ");

ToolRegistry::ToolRegistry()
{
    const QList<Tool> builtins = builtinTools();
    for (const Tool &tool : builtins) {
        m_tools.insert(tool.name, tool);
    }
}

Tool ToolRegistry::makeTool(const QString &name, const QStringList &cmd, const QString &url)
{
    Tool tool;
    tool.name = name;
    tool.cmd = cmd;
    tool.url = url;
    return tool;
}

QList<Tool> ToolRegistry::builtinTools()
{
    QList<Tool> list;

    list.append(makeTool(QStringLiteral("aider"), {QStringLiteral("aider")}, QStringLiteral("https://github.com/Aider-AI/aider")));

    {
        Tool t = makeTool(QStringLiteral("amazon_q"), {QStringLiteral("q")}, QStringLiteral("https://github.com/aws/amazon-q-developer-cli"));
        t.isProcPattern = QStringLiteral("(^|[/\\s])q(\\s|$)|qchat");
        list.append(t);
    }

    {
        // claude runs under node, the script path still ends in /claude
        Tool t = makeTool(QStringLiteral("claude"), {QStringLiteral("claude")}, QStringLiteral("https://github.com/anthropics/claude-code"));
        t.isProcPattern = QStringLiteral("(^|[/\\s])claude(\\s|$)");
        list.append(t);
    }

    list.append(makeTool(QStringLiteral("codex"),
                         {QStringLiteral("codex"), QStringLiteral("--search")},
                         QStringLiteral("https://github.com/openai/codex")));

    {
        Tool t = makeTool(QStringLiteral("copilot"),
                          {QStringLiteral("copilot"), QStringLiteral("--banner")},
                          QStringLiteral("https://github.com/github/copilot-cli"));
        t.isProcPattern = QStringLiteral("(^|[/\\s])copilot(\\s|$)|@github/copilot");
        list.append(t);
    }

    list.append(makeTool(QStringLiteral("crush"), {QStringLiteral("crush")}, QStringLiteral("https://github.com/charmbracelet/crush")));
    list.append(makeTool(QStringLiteral("cursor"), {QStringLiteral("cursor-agent")}, QStringLiteral("https://cursor.com/cli")));
    list.append(makeTool(QStringLiteral("gemini"), {QStringLiteral("gemini")}, QStringLiteral("https://github.com/google-gemini/gemini-cli")));
    list.append(makeTool(QStringLiteral("grok"), {QStringLiteral("grok")}, QStringLiteral("https://github.com/superagent-ai/grok-cli")));

    {
        Tool t = makeTool(QStringLiteral("opencode"), {QStringLiteral("opencode")}, QStringLiteral("https://github.com/sst/opencode"));
        t.env.insert(QStringLiteral("OPENCODE_THEME"), QStringLiteral("system"));
        list.append(t);
    }

    list.append(makeTool(QStringLiteral("qwen"), {QStringLiteral("qwen")}, QStringLiteral("https://github.com/QwenLM/qwen-code")));

    return list;
}

void ToolRegistry::load(const KSharedConfig::Ptr &config)
{
    if (!config) {
        return;
    }

    const QStringList groups = config->groupList();
    for (const QString &groupName : groups) {
        if (!groupName.startsWith(s_toolGroupPrefix)) {
            continue;
        }
        const QString name = groupName.mid(s_toolGroupPrefix.size()).trimmed();
        if (name.isEmpty()) {
            continue;
        }

        KConfigGroup group(config, groupName);
        if (!group.readEntry("Enabled", true)) {
            m_tools.remove(name);
            continue;
        }

        Tool tool = m_tools.value(name, makeTool(name, {}, QString()));

        const QStringList cmd = group.readEntry("Cmd", QStringList());
        if (!cmd.isEmpty()) {
            tool.cmd = cmd;
        }
        if (group.hasKey("Url")) {
            tool.url = group.readEntry("Url", QString());
        }
        if (group.hasKey("IsProc")) {
            tool.isProcPattern = group.readEntry("IsProc", QString());
        }
        tool.muxFocus = group.readEntry("MuxFocus", tool.muxFocus);
        tool.nativeScroll = group.readEntry("NativeScroll", tool.nativeScroll);

        const QStringList env = group.readEntry("Env", QStringList());
        for (const QString &entry : env) {
            if (entry.startsWith(QLatin1Char('!'))) {
                tool.env.insert(entry.mid(1), std::nullopt);
                continue;
            }
            const int eq = entry.indexOf(QLatin1Char('='));
            if (eq <= 0) {
                qWarning() << "ToolRegistry: ignoring malformed Env entry" << entry << "for" << name;
                continue;
            }
            tool.env.insert(entry.left(eq), entry.mid(eq + 1));
        }

        if (!tool.isValid()) {
            qWarning() << "ToolRegistry: tool" << name << "has no Cmd, ignoring";
            continue;
        }
        m_tools.insert(name, tool);
    }
}

const Tool *ToolRegistry::tool(const QString &name) const
{
    auto it = m_tools.constFind(name);
    if (it == m_tools.constEnd()) {
        return nullptr;
    }
    return &it.value();
}

void ToolRegistry::addTool(const Tool &tool)
{
    if (!tool.isValid()) {
        return;
    }
    m_tools.insert(tool.name, tool);
}

void ToolRegistry::removeTool(const QString &name)
{
    m_tools.remove(name);
}

} // namespace Sidekick
