/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "ProcessTableTest.h"

// Qt
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QProcess>
#include <QStandardPaths>
#include <QTest>

// Sidekick
#include "../cli/ProcessTable.h"

using namespace Sidekick;

void ProcessTableTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);

    if (!QFile::exists(QStringLiteral("/proc/self/stat"))) {
        QSKIP("/proc is not available");
    }
}

void ProcessTableTest::testReadSelf()
{
    const qint64 pid = QCoreApplication::applicationPid();
    const ProcInfo info = ProcessTable::read(pid);

    QVERIFY(info.isValid());
    QCOMPARE(info.pid, pid);
    QVERIFY(info.ppid > 0);
    QVERIFY(!info.comm.isEmpty());
    QVERIFY(!info.cmdline.isEmpty());
    QVERIFY(info.cmd().contains(QStringLiteral("ProcessTableTest")));
    QCOMPARE(QDir(info.cwd).canonicalPath(), QDir::current().canonicalPath());
}

void ProcessTableTest::testReadNonexistent()
{
    QVERIFY(!ProcessTable::read(0).isValid());
    QVERIFY(!ProcessTable::read(-1).isValid());
    // Above the default pid_max
    QVERIFY(!ProcessTable::read(4194305).isValid());
}

void ProcessTableTest::testChildren()
{
    const qint64 self = QCoreApplication::applicationPid();
    if (!QFile::exists(QStringLiteral("/proc/%1/task/%1/children").arg(self))) {
        QSKIP("kernel does not expose /proc/PID/task/TID/children");
    }

    QProcess child;
    child.start(QStringLiteral("sleep"), {QStringLiteral("30")});
    if (!child.waitForStarted(5000)) {
        QSKIP("cannot start sleep");
    }

    QVERIFY(ProcessTable::children(self).contains(child.processId()));

    const ProcInfo info = ProcessTable::read(child.processId());
    QCOMPARE(info.ppid, self);
    QCOMPARE(info.cmdline, QStringList({QStringLiteral("sleep"), QStringLiteral("30")}));

    child.kill();
    child.waitForFinished(5000);
}

void ProcessTableTest::testTreeStartsWithRoot()
{
    const qint64 self = QCoreApplication::applicationPid();
    const QList<ProcInfo> tree = ProcessTable::tree(self);
    QVERIFY(!tree.isEmpty());
    QCOMPARE(tree.first().pid, self);

    QVERIFY(ProcessTable::tree(0).isEmpty());
}

void ProcessTableTest::testCmdFallsBackToComm()
{
    ProcInfo info;
    info.pid = 2;
    info.comm = QStringLiteral("kthreadd");
    QCOMPARE(info.cmd(), QStringLiteral("kthreadd"));

    info.cmdline = QStringList({QStringLiteral("/usr/bin/claude"), QStringLiteral("--continue")});
    QCOMPARE(info.cmd(), QStringLiteral("/usr/bin/claude --continue"));
}

QTEST_GUILESS_MAIN(ProcessTableTest)

#include "moc_ProcessTableTest.cpp"
