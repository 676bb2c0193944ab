/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "PromptLibraryTest.h"

// Qt
#include <QStandardPaths>
#include <QTemporaryDir>
#include <QTest>

// KDE
#include <KConfigGroup>
#include <KSharedConfig>

// Sidekick
#include "../cli/PromptLibrary.h"

using namespace Sidekick;

void PromptLibraryTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
}

void PromptLibraryTest::testBuiltinPrompts()
{
    const QList<Prompt> builtins = PromptLibrary::builtinPrompts();
    QCOMPARE(builtins.size(), 11);

    for (const Prompt &prompt : builtins) {
        QVERIFY(!prompt.name.isEmpty());
        QVERIFY(!prompt.templateText.isEmpty());
        QVERIFY(prompt.builtin);
    }

    PromptLibrary library;
    QCOMPARE(library.prompts().size(), builtins.size());
}

void PromptLibraryTest::testLookup()
{
    PromptLibrary library;

    const Prompt *fix = library.prompt(QStringLiteral("fix"));
    QVERIFY(fix);
    QCOMPARE(fix->templateText, QStringLiteral("Can you fix {this}?"));

    const Prompt *diagnostics = library.prompt(QStringLiteral("diagnostics"));
    QVERIFY(diagnostics);
    QVERIFY(diagnostics->templateText.contains(QLatin1Char('\n')));

    QVERIFY(library.prompt(QStringLiteral("nonexistent")) == nullptr);
    QVERIFY(library.prompt(QString()) == nullptr);
}

void PromptLibraryTest::testNamesSorted()
{
    PromptLibrary library;
    const QStringList names = library.names();

    QStringList sorted = names;
    sorted.sort();
    QCOMPARE(names, sorted);
    QVERIFY(names.contains(QStringLiteral("changes")));
    QVERIFY(names.contains(QStringLiteral("selection")));
}

void PromptLibraryTest::testLoadUserPrompts()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    KSharedConfig::Ptr config = KSharedConfig::openConfig(tempDir.filePath(QStringLiteral("sidekickrc")), KConfig::SimpleConfig);
    KConfigGroup group = config->group(QStringLiteral("Prompts"));
    group.writeEntry("security", QStringLiteral("Check {file} for security issues"));
    group.writeEntry("fix", QStringLiteral("Fix {this} please"));

    PromptLibrary library;
    library.load(config);

    const Prompt *security = library.prompt(QStringLiteral("security"));
    QVERIFY(security);
    QCOMPARE(security->templateText, QStringLiteral("Check {file} for security issues"));
    QVERIFY(!security->builtin);

    // User prompts override built-ins of the same name
    const Prompt *fix = library.prompt(QStringLiteral("fix"));
    QVERIFY(fix);
    QCOMPARE(fix->templateText, QStringLiteral("Fix {this} please"));
    QVERIFY(!fix->builtin);

    QCOMPARE(library.prompts().size(), PromptLibrary::builtinPrompts().size() + 1);

    // A null config leaves the library alone
    library.load(KSharedConfig::Ptr());
    QVERIFY(library.prompt(QStringLiteral("security")));
}

void PromptLibraryTest::testLoadRemovesBuiltin()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    KSharedConfig::Ptr config = KSharedConfig::openConfig(tempDir.filePath(QStringLiteral("sidekickrc")), KConfig::SimpleConfig);
    KConfigGroup group = config->group(QStringLiteral("Prompts"));
    group.writeEntry("optimize", QString());

    PromptLibrary library;
    library.load(config);

    QVERIFY(library.prompt(QStringLiteral("optimize")) == nullptr);
    QVERIFY(!library.names().contains(QStringLiteral("optimize")));
    QVERIFY(library.prompt(QStringLiteral("explain")));
}

void PromptLibraryTest::testAddPrompt()
{
    PromptLibrary library;

    Prompt prompt;
    prompt.name = QStringLiteral("summary");
    prompt.templateText = QStringLiteral("Summarize {file}");
    prompt.builtin = false;
    library.addPrompt(prompt);

    QVERIFY(library.prompt(QStringLiteral("summary")));

    const int before = library.prompts().size();
    library.addPrompt(Prompt());
    QCOMPARE(library.prompts().size(), before);
}

void PromptLibraryTest::testPlaceholders()
{
    QCOMPARE(PromptLibrary::placeholders(QStringLiteral("Can you fix {this}?")), QStringList({QStringLiteral("this")}));
    QCOMPARE(PromptLibrary::placeholders(QStringLiteral("Fix {file}\n{diagnostics} in {file}")),
             QStringList({QStringLiteral("file"), QStringLiteral("diagnostics")}));
    QVERIFY(PromptLibrary::placeholders(QStringLiteral("Can you review my changes?")).isEmpty());
    QVERIFY(PromptLibrary::placeholders(QStringLiteral("{not a placeholder}")).isEmpty());
}

QTEST_GUILESS_MAIN(PromptLibraryTest)

#include "moc_PromptLibraryTest.cpp"
