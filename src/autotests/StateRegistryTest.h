/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef STATEREGISTRYTEST_H
#define STATEREGISTRYTEST_H

#include <QObject>

namespace Sidekick
{

class StateRegistryTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    // Lookup
    void testGetFilters();
    void testGetEmptyFilter();
    void testFilterMerged();
    void testStateForSameSession();

    // Lifecycle
    void testAttachStartsSession();
    void testAttachFailure();
    void testDetachIdempotent();
    void testExitMarksUnattached();
    void testRefreshPrunesDeadStates();

    // Dispatch
    void testWithFirstMatchOnly();
    void testWithAll();
    void testWithAllIsolatesFailures();
    void testWithSkipsRemovedStates();
    void testWithNothingMatched();
    void testWithAttachAndShow();
    void testWithShowCreatesTerminal();
    void testWithFocus();
};

}

#endif // STATEREGISTRYTEST_H
