/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "Session.h"
#include "ProcessBackend.h"
#include "ProcessTable.h"
#include "TmuxBackend.h"
#include "ToolRegistry.h"

#include <QDebug>
#include <QHash>
#include <QSet>
#include <QTimer>

#include <memory>

namespace Sidekick
{

static QHash<QString, Session::BackendFactory> &backendFactories()
{
    static QHash<QString, Session::BackendFactory> factories;
    return factories;
}

Session::Session(const Tool &tool, SessionBackend *backend, QObject *parent)
    : QObject(parent)
    , m_tool(tool)
    , m_backend(backend)
{
    Q_ASSERT(m_backend);
    m_backend->setParent(this);

    connect(m_backend, &SessionBackend::ready, this, [this]() {
        flushPending();
        Q_EMIT ready();
    });
    connect(m_backend, &SessionBackend::exited, this, &Session::onBackendExited);
}

Session::~Session() = default;

void Session::setup()
{
    static bool s_done = false;
    if (s_done) {
        return;
    }
    s_done = true;

    auto &factories = backendFactories();
    if (!factories.contains(QStringLiteral("tmux"))) {
        factories.insert(QStringLiteral("tmux"), [](const Tool &tool, QObject *parent) -> SessionBackend * {
            return new TmuxBackend(tool, parent);
        });
    }
    if (!factories.contains(QStringLiteral("process"))) {
        factories.insert(QStringLiteral("process"), [](const Tool &tool, QObject *parent) -> SessionBackend * {
            return new ProcessBackend(tool, parent);
        });
    }
}

void Session::registerBackend(const QString &name, const BackendFactory &factory)
{
    if (name.isEmpty() || !factory) {
        return;
    }
    backendFactories().insert(name, factory);
}

QStringList Session::backends()
{
    QStringList names = backendFactories().keys();
    names.sort();
    return names;
}

Session *Session::create(const Tool &tool, const QString &backendName, QObject *parent)
{
    const auto &factories = backendFactories();
    auto it = factories.constFind(backendName);
    if (it == factories.constEnd()) {
        qWarning() << "Session: unknown backend" << backendName;
        return nullptr;
    }

    SessionBackend *backend = it.value()(tool, nullptr);
    if (!backend) {
        return nullptr;
    }
    return new Session(tool, backend, parent);
}

QList<Session *> Session::discover(const ToolRegistry &tools, const QStringList &knownIds, QObject *parent)
{
    QList<Session *> result;
    if (!TmuxBackend::isAvailable()) {
        return result;
    }

    QSet<QString> seen(knownIds.cbegin(), knownIds.cend());
    const QList<Tool> allTools = tools.tools();

    const QList<TmuxBackend::PaneInfo> panes = TmuxBackend::listPanes();
    for (const TmuxBackend::PaneInfo &pane : panes) {
        if (seen.contains(pane.sessionName)) {
            continue;
        }

        const QList<ProcInfo> procs = ProcessTable::tree(pane.pid);
        auto runsTool = [&procs](const Tool &tool) {
            for (const ProcInfo &proc : procs) {
                if (tool.isProc(proc)) {
                    return true;
                }
            }
            return false;
        };

        const Tool *match = nullptr;

        // Our own sessions carry the tool name, check that one first
        QString hinted;
        if (TmuxBackend::parseSessionName(pane.sessionName, &hinted, nullptr)) {
            const Tool *tool = tools.tool(hinted);
            if (tool && runsTool(*tool)) {
                match = tool;
            }
        }

        if (!match) {
            for (const Tool &tool : allTools) {
                if (runsTool(tool)) {
                    match = tools.tool(tool.name);
                    break;
                }
            }
        }

        if (!match) {
            continue;
        }

        qDebug() << "Session: discovered" << match->name << "in tmux session" << pane.sessionName;
        seen.insert(pane.sessionName);
        result.append(new Session(*match, TmuxBackend::createForExisting(*match, pane.sessionName), parent));
    }

    return result;
}

bool Session::start()
{
    m_exited = false;
    m_readyAssumed = false;
    return m_backend->start();
}

bool Session::isAlive() const
{
    return !m_exited && m_backend->isAlive();
}

bool Session::isReady() const
{
    return !m_exited && (m_readyAssumed || m_backend->isReady());
}

bool Session::shouldQueue() const
{
    return !m_readyAssumed && m_backend->hasReadySignal() && !m_backend->isReady();
}

bool Session::send(const QString &text)
{
    PendingOp op;
    op.kind = PendingOp::Kind::Send;
    op.text = text;
    return dispatch(op);
}

bool Session::submit()
{
    PendingOp op;
    op.kind = PendingOp::Kind::Submit;
    return dispatch(op);
}

bool Session::dispatch(const PendingOp &op)
{
    if (m_exited) {
        qWarning() << "Session:" << id() << "has exited, dropping input";
        Q_EMIT livenessLost();
        return false;
    }

    // Keep call order: once something waits, everything after it waits too
    if (shouldQueue() || !m_pending.isEmpty()) {
        m_pending.append(op);
        return true;
    }

    const bool ok = op.kind == PendingOp::Kind::Send ? m_backend->send(op.text) : m_backend->submit();
    if (!ok && !m_backend->isAlive()) {
        qWarning() << "Session:" << id() << "is no longer alive";
        m_exited = true;
        Q_EMIT livenessLost();
    }
    return ok;
}

void Session::flushPending()
{
    if (m_pending.isEmpty()) {
        return;
    }

    qDebug() << "Session:" << id() << "is ready, delivering" << m_pending.size() << "queued operation(s)";
    const QList<PendingOp> pending = m_pending;
    m_pending.clear();
    for (const PendingOp &op : pending) {
        if (!dispatch(op)) {
            break;
        }
    }
}

void Session::detach()
{
    if (!m_pending.isEmpty()) {
        qDebug() << "Session:" << id() << "detached with" << m_pending.size() << "undelivered operation(s)";
        m_pending.clear();
    }
    m_backend->detach();
}

bool Session::isProc(const ProcInfo &proc) const
{
    return m_tool.isProc(proc);
}

void Session::whenReady(int fallbackMs, const std::function<void()> &callback)
{
    if (!callback) {
        return;
    }

    if (!m_backend->hasReadySignal()) {
        QTimer::singleShot(fallbackMs, this, callback);
        return;
    }

    if (isReady()) {
        QTimer::singleShot(0, this, callback);
        return;
    }

    auto fired = std::make_shared<bool>(false);
    auto connection = std::make_shared<QMetaObject::Connection>();
    auto run = [fired, connection, callback]() {
        QObject::disconnect(*connection);
        if (*fired) {
            return;
        }
        *fired = true;
        callback();
    };

    *connection = connect(this, &Session::ready, this, run);
    QTimer::singleShot(fallbackMs, this, [this, run]() {
        onReadyTimeout();
        run();
    });
}

void Session::onReadyTimeout()
{
    if (m_exited || m_readyAssumed || m_backend->isReady()) {
        return;
    }
    qDebug() << "Session:" << id() << "gave no ready signal in time, delivering anyway";
    m_readyAssumed = true;
    flushPending();
}

void Session::onBackendExited()
{
    if (m_exited) {
        return;
    }
    m_exited = true;
    if (!m_pending.isEmpty()) {
        qWarning() << "Session:" << id() << "exited with" << m_pending.size() << "undelivered operation(s)";
        m_pending.clear();
    }
    Q_EMIT exited();
}

} // namespace Sidekick

#include "moc_Session.cpp"
