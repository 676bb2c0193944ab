/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "PromptLibrary.h"

#include <QRegularExpression>

#include <KConfigGroup>

namespace Sidekick
{

PromptLibrary::PromptLibrary()
{
    const QList<Prompt> builtins = builtinPrompts();
    for (const Prompt &prompt : builtins) {
        m_prompts.insert(prompt.name, prompt);
    }
}

QList<Prompt> PromptLibrary::builtinPrompts()
{
    QList<Prompt> list;

    auto add = [&list](const char *name, const char *text) {
        Prompt p;
        p.name = QString::fromLatin1(name);
        p.templateText = QString::fromLatin1(text);
        list.append(p);
    };

    add("changes", "Can you review my changes?");
    add("diagnostics", "Can you help me fix the diagnostics in {file}?\n{diagnostics}");
    add("document", "Add documentation to {position}");
    add("explain", "Explain {this}");
    add("fix", "Can you fix {this}?");
    add("optimize", "How can {this} be optimized?");
    add("review", "Can you review {file} for any issues or improvements?");
    add("tests", "Can you write tests for {this}?");

    // Plain context, useful to paste into a conversation
    add("file", "{file}");
    add("position", "{position}");
    add("selection", "{selection}");

    return list;
}

void PromptLibrary::load(const KSharedConfig::Ptr &config)
{
    if (!config) {
        return;
    }

    const KConfigGroup group = config->group(QStringLiteral("Prompts"));
    const QStringList keys = group.keyList();
    for (const QString &key : keys) {
        const QString text = group.readEntry(key, QString());
        if (text.isEmpty()) {
            m_prompts.remove(key);
            continue;
        }
        Prompt p;
        p.name = key;
        p.templateText = text;
        p.builtin = false;
        m_prompts.insert(key, p);
    }
}

const Prompt *PromptLibrary::prompt(const QString &name) const
{
    auto it = m_prompts.constFind(name);
    if (it == m_prompts.constEnd()) {
        return nullptr;
    }
    return &it.value();
}

void PromptLibrary::addPrompt(const Prompt &prompt)
{
    if (prompt.name.isEmpty()) {
        return;
    }
    m_prompts.insert(prompt.name, prompt);
}

QStringList PromptLibrary::placeholders(const QString &templateText)
{
    static const QRegularExpression placeholder(QStringLiteral("\\{(\\w+)\\}"));

    QStringList result;
    auto it = placeholder.globalMatch(templateText);
    while (it.hasNext()) {
        const QString name = it.next().captured(1);
        if (!result.contains(name)) {
            result.append(name);
        }
    }
    return result;
}

} // namespace Sidekick
