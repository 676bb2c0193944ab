/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SIDEKICK_CONTEXT_H
#define SIDEKICK_CONTEXT_H

#include "sidekick_export.h"

#include "Text.h"

#include <QString>

#include <optional>

namespace Sidekick
{

class Host;
class PromptLibrary;

/**
 * What to send: a literal message template, the name of a prompt, or
 * already structured text. An empty text is still something to send.
 */
struct SIDEKICK_EXPORT Message {
    std::optional<QString> msg;
    std::optional<QString> prompt;
    std::optional<Text> text;
};

/**
 * Context renders messages, filling {placeholder} fields from the Host.
 */
class SIDEKICK_EXPORT Context
{
public:
    struct Rendered {
        QString msg;
        std::optional<Text> text; // nullopt when there is nothing to send
    };

    Context(const Host *host, const PromptLibrary *prompts);

    /**
     * Render a message. The result is empty (no text) when the prompt is
     * unknown or a placeholder has no value.
     */
    Rendered render(const Message &message) const;
    Rendered render(const QString &templateText) const;

private:
    std::optional<Text> expand(const QString &templateText) const;

    const Host *m_host = nullptr;
    const PromptLibrary *m_prompts = nullptr;
};

} // namespace Sidekick

#endif // SIDEKICK_CONTEXT_H
