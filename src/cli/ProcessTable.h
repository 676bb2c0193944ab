/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SIDEKICK_PROCESSTABLE_H
#define SIDEKICK_PROCESSTABLE_H

#include "sidekick_export.h"

#include <QList>
#include <QString>
#include <QStringList>

namespace Sidekick
{

/**
 * Snapshot of one live OS process
 */
struct SIDEKICK_EXPORT ProcInfo {
    qint64 pid = 0;
    qint64 ppid = 0;
    QString comm;          // short executable name from /proc/{pid}/comm
    QStringList cmdline;   // full argument vector
    QString cwd;

    bool isValid() const
    {
        return pid > 0;
    }

    /**
     * Command line joined by spaces, falls back to comm for kernel threads
     */
    QString cmd() const;
};

/**
 * Reads process information from /proc.
 *
 * Used to match live processes against a tool's identification rule,
 * e.g. when rediscovering tmux sessions left over from a previous run.
 */
class SIDEKICK_EXPORT ProcessTable
{
public:
    /**
     * Read a single process. Returns an invalid ProcInfo if it is gone.
     */
    static ProcInfo read(qint64 pid);

    /**
     * Direct children of a process, from /proc/{pid}/task/{tid}/children
     */
    static QList<qint64> children(qint64 pid);

    /**
     * The process itself followed by all its descendants (depth first)
     */
    static QList<ProcInfo> tree(qint64 rootPid);

private:
    ProcessTable() = default;

    static QString procPath(qint64 pid, const QString &entry);
};

} // namespace Sidekick

#endif // SIDEKICK_PROCESSTABLE_H
