/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "CliTest.h"

// Qt
#include <QSignalSpy>
#include <QStandardPaths>
#include <QTest>

// KDE
#include <KConfigGroup>
#include <KSharedConfig>

// Sidekick
#include "../cli/Cli.h"
#include "../cli/Session.h"
#include "../cli/SidekickSettings.h"
#include "../cli/Terminal.h"
#include "TestHelpers.h"

using namespace Sidekick;

static FakeBackend *fakeOf(State *state)
{
    return qobject_cast<FakeBackend *>(state->session()->backend());
}

static int warningsContaining(const RecordingHost *host, const QString &needle)
{
    int n = 0;
    for (const auto &notice : host->notices) {
        if (notice.first == Host::Level::Warning && notice.second.contains(needle)) {
            ++n;
        }
    }
    return n;
}

void CliTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
    Session::setup();
    FakeBackend::registerFactory();
}

void CliTest::init()
{
    m_tempDir = new QTemporaryDir();
    QVERIFY(m_tempDir->isValid());

    KSharedConfig::Ptr config = KSharedConfig::openConfig(m_tempDir->filePath(QStringLiteral("sidekickrc")), KConfig::SimpleConfig);
    KConfigGroup general = config->group(QStringLiteral("General"));
    general.writeEntry("DefaultBackend", QStringLiteral("fake"));
    general.writeEntry("SendGraceMs", 200);
    general.writeEntry("PromptGraceMs", 100);

    m_host = new RecordingHost();
    m_host->executables = QStringList({QStringLiteral("claude"), QStringLiteral("codex"), QStringLiteral("aider")});

    m_settings = new SidekickSettings(config);
    m_cli = new Cli(m_host, m_settings);

    FakeBackend::registerFactory();
    FakeBackend::created().clear();
}

void CliTest::cleanup()
{
    delete m_cli;
    m_cli = nullptr;
    delete m_settings;
    m_settings = nullptr;
    delete m_host;
    m_host = nullptr;
    delete m_tempDir;
    m_tempDir = nullptr;
}

void CliTest::testNewSession()
{
    State *state = m_cli->newSession(QStringLiteral("codex"));
    QVERIFY(state);
    QCOMPARE(state->name(), QStringLiteral("codex"));
    QVERIFY(state->isAttached());
    QVERIFY(state->terminal());
    QVERIFY(state->terminal()->isOpen());
    QVERIFY(!state->terminal()->isFocused());

    QCOMPARE(FakeBackend::created().size(), 1);
    QCOMPARE(fakeOf(state)->startCount, 1);
    QCOMPARE(m_cli->registry()->count(), 1);

    Cli::NewOptions options;
    options.name = QStringLiteral("codex");
    options.focus = true;
    State *focused = m_cli->newSession(options);
    QVERIFY(focused);
    QVERIFY(focused != state);
    QVERIFY(focused->terminal()->isFocused());
    QCOMPARE(m_cli->registry()->count(), 2);
}

void CliTest::testNewSessionDefaultTool()
{
    State *state = m_cli->newSession();
    QVERIFY(state);
    QCOMPARE(state->name(), QStringLiteral("claude"));

    m_settings->setDefaultTool(QStringLiteral("aider"));
    state = m_cli->newSession();
    QVERIFY(state);
    QCOMPARE(state->name(), QStringLiteral("aider"));
}

void CliTest::testNewSessionUnknownTool()
{
    QVERIFY(m_cli->newSession(QStringLiteral("nonexistent")) == nullptr);
    QVERIFY(m_host->hasNotice(Host::Level::Error, QStringLiteral("Unknown tool: nonexistent")));
    QCOMPARE(m_cli->registry()->count(), 0);
    QVERIFY(FakeBackend::created().isEmpty());
}

void CliTest::testNewSessionMissingExecutable()
{
    QVERIFY(m_cli->newSession(QStringLiteral("gemini")) == nullptr);
    QCOMPARE(m_host->missing, QStringList({QStringLiteral("gemini")}));
    QVERIFY(m_host->hasNotice(Host::Level::Error, QStringLiteral("gemini")));
    QCOMPARE(m_cli->registry()->count(), 0);
    // Nothing was spawned
    QVERIFY(FakeBackend::created().isEmpty());
}

void CliTest::testNewSessionUnknownBackend()
{
    Cli::NewOptions options;
    options.name = QStringLiteral("claude");
    options.backend = QStringLiteral("nonexistent");

    QVERIFY(m_cli->newSession(options) == nullptr);
    QVERIFY(m_host->hasNotice(Host::Level::Error, QStringLiteral("nonexistent")));
    QCOMPARE(m_cli->registry()->count(), 0);
}

void CliTest::testSendMessage()
{
    State *state = m_cli->newSession(QStringLiteral("claude"));
    QVERIFY(state);
    QSignalSpy deliveredSpy(m_cli, &Cli::delivered);

    m_cli->send(QStringLiteral("hello"));

    // Delivery happens on the next event loop turn
    QVERIFY(fakeOf(state)->sends.isEmpty());
    QTRY_COMPARE(fakeOf(state)->sends, QStringList({QStringLiteral("hello\n")}));
    QCOMPARE(fakeOf(state)->submitCount, 0);

    QCOMPARE(deliveredSpy.count(), 1);
    QCOMPARE(deliveredSpy.first().at(0).toString(), state->sessionId());
    QCOMPARE(deliveredSpy.first().at(1).toString(), QStringLiteral("hello\n"));
}

void CliTest::testSendEmptyText()
{
    State *state = m_cli->newSession(QStringLiteral("claude"));
    QVERIFY(state);

    Cli::SendOptions options;
    options.message.text = Text();
    m_cli->send(options);

    QTRY_COMPARE(fakeOf(state)->sends, QStringList({QStringLiteral("\n")}));
    QCOMPARE(m_host->count(Host::Level::Warning), 0);
}

void CliTest::testSendLoneNewline()
{
    State *state = m_cli->newSession(QStringLiteral("claude"));
    QVERIFY(state);

    m_cli->send(QStringLiteral("\n"));

    QTRY_COMPARE(fakeOf(state)->sends, QStringList({QStringLiteral("\n")}));
    QCOMPARE(m_host->count(Host::Level::Warning), 0);
}

void CliTest::testSendNothing()
{
    State *state = m_cli->newSession(QStringLiteral("claude"));
    QVERIFY(state);

    m_cli->send(QString());
    QCOMPARE(warningsContaining(m_host, QStringLiteral("Nothing to send.")), 1);

    // A placeholder without a value renders to nothing as well
    m_cli->send(QStringLiteral("Explain {selection}"));
    QCOMPARE(warningsContaining(m_host, QStringLiteral("Nothing to send.")), 2);

    Cli::SendOptions unknownPrompt;
    unknownPrompt.message.prompt = QStringLiteral("nonexistent");
    m_cli->send(unknownPrompt);
    QCOMPARE(warningsContaining(m_host, QStringLiteral("Nothing to send.")), 3);

    QTest::qWait(20);
    QVERIFY(fakeOf(state)->sends.isEmpty());
    QCOMPARE(m_host->selectSessionCount, 0);
    QCOMPARE(m_cli->registry()->count(), 1);
}

void CliTest::testSendSubmit()
{
    State *state = m_cli->newSession(QStringLiteral("claude"));
    QVERIFY(state);

    Cli::SendOptions options;
    options.message.msg = QStringLiteral("run it");
    options.submit = true;
    m_cli->send(options);

    QTRY_COMPARE(fakeOf(state)->submitCount, 1);
    QCOMPARE(fakeOf(state)->operations, QStringList({QStringLiteral("send:run it\n"), QStringLiteral("submit")}));
}

void CliTest::testSendVisualSelection()
{
    State *state = m_cli->newSession(QStringLiteral("claude"));
    QVERIFY(state);

    m_host->visualMode = true;
    m_host->values.insert(QStringLiteral("selection"), textFromString(QStringLiteral("int x;"), TextChunk::Kind::Selection));

    m_cli->send(Cli::SendOptions());

    QTRY_COMPARE(fakeOf(state)->sends, QStringList({QStringLiteral("int x;\n")}));
    QCOMPARE(m_host->exitVisualModeCount, 1);
    QVERIFY(!m_host->visualMode);
}

void CliTest::testSendOpensPickerWhenNothingMatches()
{
    m_host->pickFirstState = false;
    m_host->toolChoice = QStringLiteral("claude");

    m_cli->send(QStringLiteral("hi"));

    QCOMPARE(m_host->selectSessionCount, 1);
    QVERIFY(m_host->offeredTools.contains(QStringLiteral("claude")));
    QVERIFY(m_host->offeredTools.contains(QStringLiteral("codex")));
    QVERIFY(!m_host->offeredTools.contains(QStringLiteral("gemini")));

    QCOMPARE(m_cli->registry()->count(), 1);
    State *state = m_cli->registry()->states().first();
    QVERIFY(state->isAttached());
    QTRY_COMPARE(fakeOf(state)->sends, QStringList({QStringLiteral("hi\n")}));
}

void CliTest::testSendPickerRestrictedToName()
{
    QVERIFY(m_cli->newSession(QStringLiteral("claude")));
    m_host->pickFirstState = false;

    Cli::SendOptions options;
    options.name = QStringLiteral("codex");
    options.message.msg = QStringLiteral("hi");
    m_cli->send(options);

    QCOMPARE(m_host->selectSessionCount, 1);
    QCOMPARE(m_host->offeredTools, QStringList({QStringLiteral("codex")}));

    // Picker cancelled, nothing started
    QCOMPARE(m_cli->registry()->count(), 1);
}

void CliTest::testSendDroppedAfterClose()
{
    State *state = m_cli->newSession(QStringLiteral("claude"));
    QVERIFY(state);
    QPointer<FakeBackend> backend(fakeOf(state));
    QSignalSpy deliveredSpy(m_cli, &Cli::delivered);

    m_cli->send(QStringLiteral("late"));
    m_cli->close(Cli::HideOptions());
    QCOMPARE(m_cli->registry()->count(), 0);

    QTest::qWait(20);
    QCOMPARE(deliveredSpy.count(), 0);
    QVERIFY(!backend || backend->sends.isEmpty());
}

void CliTest::testMySendStartsSession()
{
    QSignalSpy deliveredSpy(m_cli, &Cli::delivered);

    m_cli->mySend(QStringLiteral("hello"));

    QCOMPARE(m_cli->registry()->count(), 1);
    State *state = m_cli->registry()->states().first();
    QCOMPARE(state->name(), QStringLiteral("claude"));
    QVERIFY(state->isAttached());

    // Nothing goes out before the grace period
    QTest::qWait(50);
    QVERIFY(fakeOf(state)->sends.isEmpty());

    QTRY_COMPARE(fakeOf(state)->sends, QStringList({QStringLiteral("hello\n")}));

    QTest::qWait(250);
    QCOMPARE(fakeOf(state)->sends.size(), 1);
    QCOMPARE(deliveredSpy.count(), 1);
    QCOMPARE(m_cli->registry()->count(), 1);
    QCOMPARE(m_host->selectSessionCount, 0);
}

void CliTest::testMySendWithoutReadySignal()
{
    // A tool that never reports readiness still gets the message after the grace period
    FakeBackend::registerFactory(true);
    QSignalSpy deliveredSpy(m_cli, &Cli::delivered);

    m_cli->mySend(QStringLiteral("hello"));

    QCOMPARE(m_cli->registry()->count(), 1);
    State *state = m_cli->registry()->states().first();
    QVERIFY(fakeOf(state)->withReadySignal);
    QVERIFY(!state->session()->isReady());

    QTRY_COMPARE(fakeOf(state)->sends, QStringList({QStringLiteral("hello\n")}));
    QCOMPARE(state->session()->pendingCount(), 0);
    QCOMPARE(deliveredSpy.count(), 1);
}

void CliTest::testMySendUsesAttachedSession()
{
    State *state = m_cli->newSession(QStringLiteral("claude"));
    QVERIFY(state);
    m_settings->setSendGraceMs(10000);

    m_cli->mySend(QStringLiteral("hello"));

    QTRY_COMPARE_WITH_TIMEOUT(fakeOf(state)->sends, QStringList({QStringLiteral("hello\n")}), 1000);
    QCOMPARE(m_cli->registry()->count(), 1);
    QCOMPARE(FakeBackend::created().size(), 1);
}

void CliTest::testMySendTargetsNewSession()
{
    // A known but un-attached session of the same tool
    State *idle = m_cli->registry()->stateFor(makeSession(QStringLiteral("claude"), QStringLiteral("idle")));
    QVERIFY(idle);
    QVERIFY(!idle->isAttached());

    m_cli->mySend(QStringLiteral("hello"));

    QCOMPARE(m_cli->registry()->count(), 2);
    State *fresh = m_cli->registry()->states().last();
    QVERIFY(fresh != idle);

    QTRY_COMPARE(fakeOf(fresh)->sends, QStringList({QStringLiteral("hello\n")}));
    QVERIFY(fakeOf(idle)->sends.isEmpty());
}

void CliTest::testShowAttaches()
{
    State *state = m_cli->registry()->stateFor(makeSession(QStringLiteral("claude"), QStringLiteral("s1")));
    QVERIFY(!state->isAttached());

    m_cli->show(QStringLiteral("claude"));

    QVERIFY(state->isAttached());
    QVERIFY(state->terminal()->isOpen());
    QVERIFY(!state->terminal()->isFocused());

    Cli::ShowOptions options;
    options.focus = true;
    m_cli->show(options);
    QVERIFY(state->terminal()->isFocused());
}

void CliTest::testHide()
{
    State *first = m_cli->newSession(QStringLiteral("claude"));
    State *second = m_cli->newSession(QStringLiteral("codex"));
    QVERIFY(first && second);

    m_cli->hide(Cli::HideOptions());
    QVERIFY(!first->terminal()->isOpen());
    QVERIFY(second->terminal()->isOpen());

    // Hidden terminals still count as having one
    Cli::HideOptions all;
    all.all = true;
    m_cli->hide(all);
    QVERIFY(!second->terminal()->isOpen());

    // A State without a terminal is left alone
    State *bare = m_cli->registry()->stateFor(makeSession(QStringLiteral("aider"), QStringLiteral("bare")));
    m_cli->hide(QStringLiteral("aider"));
    QVERIFY(!bare->terminal());
    QVERIFY(first->isAttached());
    QVERIFY(second->isAttached());
}

void CliTest::testToggle()
{
    State *state = m_cli->newSession(QStringLiteral("claude"));
    QVERIFY(state);
    Terminal *terminal = state->terminal();
    QVERIFY(terminal->isOpen());

    m_cli->toggle();
    QVERIFY(!terminal->isOpen());

    m_cli->toggle();
    QVERIFY(terminal->isOpen());
    QVERIFY(terminal->isFocused());

    m_cli->toggle();
    QVERIFY(!terminal->isOpen());
    QVERIFY(!terminal->isFocused());
    QVERIFY(state->isAttached());
}

void CliTest::testToggleAttachesAndShows()
{
    State *state = m_cli->registry()->stateFor(makeSession(QStringLiteral("claude"), QStringLiteral("s1")));
    QVERIFY(!state->isAttached());

    m_cli->toggle(QStringLiteral("claude"));

    QVERIFY(state->isAttached());
    QVERIFY(state->terminal());
    QVERIFY(state->terminal()->isOpen());
    QVERIFY(state->terminal()->isFocused());

    // Nothing to toggle
    m_cli->toggle(QStringLiteral("codex"));
    QCOMPARE(m_cli->registry()->count(), 1);
}

void CliTest::testFocus()
{
    State *state = m_cli->newSession(QStringLiteral("claude"));
    QVERIFY(state);
    Terminal *terminal = state->terminal();
    terminal->hide();

    m_cli->focus();
    QVERIFY(terminal->isOpen());
    QVERIFY(terminal->isFocused());

    m_cli->focus();
    QVERIFY(terminal->isOpen());
    QVERIFY(!terminal->isFocused());
}

void CliTest::testClose()
{
    State *first = m_cli->newSession(QStringLiteral("claude"));
    State *second = m_cli->newSession(QStringLiteral("codex"));
    QVERIFY(first && second);
    FakeBackend *backend = fakeOf(second);

    m_cli->close(QStringLiteral("codex"));

    QCOMPARE(m_cli->registry()->count(), 1);
    QVERIFY(m_cli->registry()->contains(first));
    QCOMPARE(backend->detachCount, 1);

    // Closing again finds nothing
    m_cli->close(QStringLiteral("codex"));
    QCOMPARE(m_cli->registry()->count(), 1);
}

void CliTest::testCloseAll()
{
    QVERIFY(m_cli->newSession(QStringLiteral("claude")));
    QVERIFY(m_cli->newSession(QStringLiteral("codex")));
    QVERIFY(m_cli->newSession(QStringLiteral("aider")));
    QCOMPARE(m_cli->registry()->count(), 3);

    Cli::HideOptions options;
    options.all = true;
    m_cli->close(options);

    QCOMPARE(m_cli->registry()->count(), 0);
    QVERIFY(m_cli->registry()->get().isEmpty());
}

void CliTest::testPrompt()
{
    State *state = m_cli->newSession(QStringLiteral("claude"));
    QVERIFY(state);
    m_host->promptChoice = QStringLiteral("changes");

    m_cli->prompt();

    QCOMPARE(m_host->offeredPrompts, m_cli->prompts().names());
    QTRY_COMPARE(fakeOf(state)->sends, QStringList({QStringLiteral("Can you review my changes?\n")}));
}

void CliTest::testPromptCallback()
{
    m_host->promptChoice = QStringLiteral("explain");
    m_host->values.insert(QStringLiteral("this"), textFromString(QStringLiteral("main()")));

    QString received;
    std::optional<Text> receivedText;
    m_cli->prompt([&received, &receivedText](const QString &msg, const std::optional<Text> &text) {
        received = msg;
        receivedText = text;
    });

    QCOMPARE(received, QStringLiteral("Explain main()"));
    QVERIFY(receivedText);

    // Renders to nothing without a value for {this}
    m_host->values.clear();
    m_cli->prompt([&received, &receivedText](const QString &msg, const std::optional<Text> &text) {
        received = msg;
        receivedText = text;
    });
    QVERIFY(received.isEmpty());
    QVERIFY(!receivedText);
}

void CliTest::testPromptCancelled()
{
    m_host->promptChoice = QString();

    int calls = 0;
    m_cli->prompt([&calls](const QString &, const std::optional<Text> &) {
        ++calls;
    });

    QCOMPARE(calls, 0);
    QCOMPARE(m_cli->registry()->count(), 0);
}

void CliTest::testMyPrompt()
{
    m_host->promptChoice = QStringLiteral("changes");

    Cli::PromptOptions options;
    options.name = QStringLiteral("codex");
    m_cli->myPrompt(options);

    QCOMPARE(m_cli->registry()->count(), 1);
    State *state = m_cli->registry()->states().first();
    QCOMPARE(state->name(), QStringLiteral("codex"));

    // The picker waits for the session
    QVERIFY(m_host->offeredPrompts.isEmpty());
    QTRY_VERIFY(!m_host->offeredPrompts.isEmpty());
    QTRY_COMPARE(fakeOf(state)->sends, QStringList({QStringLiteral("Can you review my changes?\n")}));

    // Attached now, no second session
    m_host->offeredPrompts.clear();
    m_cli->myPrompt(options);
    QVERIFY(!m_host->offeredPrompts.isEmpty());
    QCOMPARE(m_cli->registry()->count(), 1);
}

void CliTest::testSelect()
{
    State *state = m_cli->registry()->stateFor(makeSession(QStringLiteral("claude"), QStringLiteral("s1")));
    QVERIFY(!state->isAttached());

    m_cli->select();

    QCOMPARE(m_host->selectSessionCount, 1);
    QVERIFY(state->isAttached());
    QVERIFY(state->terminal()->isOpen());

    State *picked = nullptr;
    m_cli->select([&picked](State *state) {
        picked = state;
    });
    QCOMPARE(picked, state);
}

void CliTest::testSelectStartsTool()
{
    m_host->pickFirstState = false;
    m_host->toolChoice = QStringLiteral("aider");

    State *picked = nullptr;
    int calls = 0;
    Cli::SelectOptions options;
    options.callback = [&picked, &calls](State *state) {
        picked = state;
        ++calls;
    };
    m_cli->select(options);

    QVERIFY(picked);
    QCOMPARE(picked->name(), QStringLiteral("aider"));
    QVERIFY(picked->isAttached());

    // Cancelled
    m_host->toolChoice.clear();
    m_cli->select(options);
    QCOMPARE(calls, 2);
    QVERIFY(picked == nullptr);
    QCOMPARE(m_cli->registry()->count(), 1);
}

void CliTest::testRender()
{
    const Context::Rendered rendered = m_cli->render(QStringLiteral("plain text"));
    QCOMPARE(rendered.msg, QStringLiteral("plain text"));
    QVERIFY(rendered.text);

    Message message;
    message.prompt = QStringLiteral("changes");
    QCOMPARE(m_cli->render(message).msg, QStringLiteral("Can you review my changes?"));
}

void CliTest::testDeprecatedAliasesWarnOnce()
{
    State *state = m_cli->newSession(QStringLiteral("claude"));
    QVERIFY(state);

    m_cli->ask(QStringLiteral("one"));
    m_cli->ask(QStringLiteral("two"));
    QCOMPARE(warningsContaining(m_host, QStringLiteral("deprecated")), 1);
    QVERIFY(m_host->hasNotice(Host::Level::Warning, QStringLiteral("ask()")));

    // Still forwards every call
    QTRY_COMPARE(fakeOf(state)->sends, QStringList({QStringLiteral("one\n"), QStringLiteral("two\n")}));

    m_cli->selectTool();
    m_cli->selectTool();
    QCOMPARE(warningsContaining(m_host, QStringLiteral("deprecated")), 2);

    m_host->promptChoice = QString();
    m_cli->selectPrompt();
    m_cli->selectPrompt();
    QCOMPARE(warningsContaining(m_host, QStringLiteral("deprecated")), 3);
}

QTEST_GUILESS_MAIN(CliTest)

#include "moc_CliTest.cpp"
