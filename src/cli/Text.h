/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SIDEKICK_TEXT_H
#define SIDEKICK_TEXT_H

#include "sidekick_export.h"

#include <QList>
#include <QString>

namespace Sidekick
{

/**
 * One typed piece of a rendered message line.
 */
struct SIDEKICK_EXPORT TextChunk {
    enum class Kind {
        Plain,
        File,       // file path reference
        Selection,  // text taken from the current selection
        Position,   // file:line[:col] reference
        Diagnostic  // compiler / linter message
    };

    QString text;
    Kind kind = Kind::Plain;

    bool operator==(const TextChunk &other) const
    {
        return text == other.text && kind == other.kind;
    }
};

using TextLine = QList<TextChunk>;

/**
 * Structured message: ordered lines of ordered chunks.
 *
 * An empty Text is a valid message (it formats to an empty string), which is
 * different from "no text at all" (std::nullopt where a Text is optional).
 */
using Text = QList<TextLine>;

/**
 * Concatenate chunks of each line and join lines with '\n'.
 */
SIDEKICK_EXPORT QString textToString(const Text &text);

/**
 * Split a literal string into lines of single plain chunks.
 * Empty lines become empty TextLines, so "\n" gives two empty lines.
 */
SIDEKICK_EXPORT Text textFromString(const QString &str, TextChunk::Kind kind = TextChunk::Kind::Plain);

} // namespace Sidekick

#endif // SIDEKICK_TEXT_H
