/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "Tool.h"

#include <QDebug>
#include <QFileInfo>
#include <QProcessEnvironment>

namespace Sidekick
{

QString Tool::defaultProcPattern() const
{
    const QString base = QFileInfo(executable()).fileName();
    if (base.isEmpty()) {
        return QString();
    }
    return QStringLiteral("(^|[/\\s])%1(\\s|$)").arg(QRegularExpression::escape(base));
}

bool Tool::isProc(const ProcInfo &proc) const
{
    if (!proc.isValid()) {
        return false;
    }

    if (isProcFunction) {
        return isProcFunction(*this, proc);
    }

    const QString pattern = isProcPattern.isEmpty() ? defaultProcPattern() : isProcPattern;
    if (pattern.isEmpty()) {
        return false;
    }

    const QRegularExpression re(pattern);
    if (!re.isValid()) {
        qWarning() << "Tool: invalid process pattern for" << name << ":" << re.errorString();
        return false;
    }
    return re.match(proc.cmd()).hasMatch();
}

QString Tool::format(const Text &text) const
{
    if (formatter) {
        return formatter(text);
    }
    return textToString(text);
}

void Tool::applyEnvironment(QProcessEnvironment &environment) const
{
    for (auto it = env.cbegin(); it != env.cend(); ++it) {
        if (it.value().has_value()) {
            environment.insert(it.key(), *it.value());
        } else {
            environment.remove(it.key());
        }
    }
}

} // namespace Sidekick
