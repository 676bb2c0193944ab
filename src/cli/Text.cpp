/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "Text.h"

#include <QStringList>

namespace Sidekick
{

QString textToString(const Text &text)
{
    QStringList lines;
    lines.reserve(text.size());
    for (const TextLine &line : text) {
        QString str;
        for (const TextChunk &chunk : line) {
            str += chunk.text;
        }
        lines.append(str);
    }
    return lines.join(QLatin1Char('\n'));
}

Text textFromString(const QString &str, TextChunk::Kind kind)
{
    Text text;
    const QStringList lines = str.split(QLatin1Char('\n'));
    for (const QString &line : lines) {
        TextLine textLine;
        if (!line.isEmpty()) {
            textLine.append(TextChunk{line, kind});
        }
        text.append(textLine);
    }
    return text;
}

} // namespace Sidekick
