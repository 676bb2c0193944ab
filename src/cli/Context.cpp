/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "Context.h"
#include "Host.h"
#include "PromptLibrary.h"

#include <QDebug>
#include <QRegularExpression>

namespace Sidekick
{

Context::Context(const Host *host, const PromptLibrary *prompts)
    : m_host(host)
    , m_prompts(prompts)
{
}

Context::Rendered Context::render(const QString &templateText) const
{
    Message message;
    message.msg = templateText;
    return render(message);
}

Context::Rendered Context::render(const Message &message) const
{
    Rendered result;

    if (message.text) {
        result.text = message.text;
        result.msg = textToString(*message.text);
        return result;
    }

    QString templateText;
    if (message.prompt) {
        const Prompt *prompt = m_prompts ? m_prompts->prompt(*message.prompt) : nullptr;
        if (!prompt) {
            qWarning() << "Context: unknown prompt" << *message.prompt;
            return result;
        }
        templateText = prompt->templateText;
    } else if (message.msg) {
        templateText = *message.msg;
    }

    if (templateText.isEmpty()) {
        return result;
    }

    result.text = expand(templateText);
    if (result.text) {
        result.msg = textToString(*result.text);
    }
    return result;
}

std::optional<Text> Context::expand(const QString &templateText) const
{
    static const QRegularExpression placeholder(QStringLiteral("\\{(\\w+)\\}"));

    Text text;
    const QStringList lines = templateText.split(QLatin1Char('\n'));
    for (const QString &line : lines) {
        text.append(TextLine());

        int pos = 0;
        auto it = placeholder.globalMatch(line);
        while (it.hasNext()) {
            const QRegularExpressionMatch match = it.next();
            if (match.capturedStart() > pos) {
                text.last().append(TextChunk{line.mid(pos, match.capturedStart() - pos), TextChunk::Kind::Plain});
            }
            pos = match.capturedEnd();

            const std::optional<Text> value = m_host ? m_host->contextValue(match.captured(1)) : std::nullopt;
            if (!value || value->isEmpty()) {
                qDebug() << "Context: no value for" << match.captured(0);
                return std::nullopt;
            }

            // A multi-line value continues on the current line
            for (int i = 0; i < value->size(); ++i) {
                if (i > 0) {
                    text.append(TextLine());
                }
                text.last().append(value->at(i));
            }
        }
        if (pos < line.size()) {
            text.last().append(TextChunk{line.mid(pos), TextChunk::Kind::Plain});
        }
    }
    return text;
}

} // namespace Sidekick
