/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ProcessTable.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSet>

namespace Sidekick
{

QString ProcInfo::cmd() const
{
    if (cmdline.isEmpty()) {
        return comm;
    }
    return cmdline.join(QLatin1Char(' '));
}

QString ProcessTable::procPath(qint64 pid, const QString &entry)
{
    return QStringLiteral("/proc/%1/%2").arg(pid).arg(entry);
}

ProcInfo ProcessTable::read(qint64 pid)
{
    ProcInfo info;
    if (pid <= 0) {
        return info;
    }

    QFile statFile(procPath(pid, QStringLiteral("stat")));
    if (!statFile.open(QIODevice::ReadOnly)) {
        return info;
    }
    const QString stat = QString::fromLocal8Bit(statFile.readAll());
    statFile.close();

    // Format: pid (comm) state ppid ...
    // comm may contain spaces and parentheses, so split at the last ')'
    const int open = stat.indexOf(QLatin1Char('('));
    const int close = stat.lastIndexOf(QLatin1Char(')'));
    if (open < 0 || close < open) {
        return info;
    }
    info.comm = stat.mid(open + 1, close - open - 1);
    const QStringList rest = stat.mid(close + 1).split(QLatin1Char(' '), Qt::SkipEmptyParts);
    if (rest.size() >= 2) {
        info.ppid = rest[1].toLongLong();
    }

    QFile cmdlineFile(procPath(pid, QStringLiteral("cmdline")));
    if (cmdlineFile.open(QIODevice::ReadOnly)) {
        const QByteArray data = cmdlineFile.readAll();
        const QList<QByteArray> args = data.split('\0');
        for (const QByteArray &arg : args) {
            if (!arg.isEmpty()) {
                info.cmdline.append(QString::fromLocal8Bit(arg));
            }
        }
    }

    info.cwd = QFileInfo(procPath(pid, QStringLiteral("cwd"))).symLinkTarget();
    info.pid = pid;
    return info;
}

QList<qint64> ProcessTable::children(qint64 pid)
{
    QList<qint64> result;
    if (pid <= 0) {
        return result;
    }

    const QDir taskDir(procPath(pid, QStringLiteral("task")));
    const QStringList tids = taskDir.entryList(QDir::Dirs | QDir::NoDotAndDotDot);
    for (const QString &tid : tids) {
        QFile file(taskDir.filePath(tid + QStringLiteral("/children")));
        if (!file.open(QIODevice::ReadOnly)) {
            continue;
        }
        const QStringList pids = QString::fromLatin1(file.readAll()).split(QLatin1Char(' '), Qt::SkipEmptyParts);
        for (const QString &child : pids) {
            bool ok = false;
            const qint64 childPid = child.trimmed().toLongLong(&ok);
            if (ok && childPid > 0) {
                result.append(childPid);
            }
        }
    }

    return result;
}

QList<ProcInfo> ProcessTable::tree(qint64 rootPid)
{
    QList<ProcInfo> result;
    QSet<qint64> seen;
    QList<qint64> stack{rootPid};

    while (!stack.isEmpty()) {
        const qint64 pid = stack.takeLast();
        if (seen.contains(pid)) {
            continue;
        }
        seen.insert(pid);

        const ProcInfo info = read(pid);
        if (!info.isValid()) {
            continue;
        }
        result.append(info);

        const QList<qint64> kids = children(pid);
        // Push in reverse so the first child is visited first
        for (auto it = kids.crbegin(); it != kids.crend(); ++it) {
            stack.append(*it);
        }
    }

    return result;
}

} // namespace Sidekick
