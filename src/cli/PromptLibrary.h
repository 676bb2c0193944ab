/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SIDEKICK_PROMPTLIBRARY_H
#define SIDEKICK_PROMPTLIBRARY_H

#include "sidekick_export.h"

#include <QList>
#include <QMap>
#include <QString>
#include <QStringList>

#include <KSharedConfig>

namespace Sidekick
{

/**
 * A named message template. {placeholder} fields are filled in when
 * the prompt is rendered, e.g. "Can you fix {this}?"
 */
struct SIDEKICK_EXPORT Prompt {
    QString name;
    QString templateText;
    bool builtin = true;
};

/**
 * Built-in and user-defined prompts.
 *
 * User prompts live in the [Prompts] group of sidekickrc, one entry per
 * prompt. An entry with an empty value removes the built-in of that name.
 */
class SIDEKICK_EXPORT PromptLibrary
{
public:
    PromptLibrary();

    static QList<Prompt> builtinPrompts();

    void load(const KSharedConfig::Ptr &config);

    /**
     * Look up a prompt by name, nullptr if unknown
     */
    const Prompt *prompt(const QString &name) const;

    QList<Prompt> prompts() const
    {
        return m_prompts.values();
    }

    QStringList names() const
    {
        return m_prompts.keys();
    }

    void addPrompt(const Prompt &prompt);

    /**
     * Placeholder names used by a template, in order of appearance
     */
    static QStringList placeholders(const QString &templateText);

private:
    QMap<QString, Prompt> m_prompts;
};

} // namespace Sidekick

#endif // SIDEKICK_PROMPTLIBRARY_H
