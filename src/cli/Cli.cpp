/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "Cli.h"
#include "Host.h"
#include "Session.h"
#include "SidekickSettings.h"
#include "Terminal.h"

#include <QDebug>
#include <QPointer>
#include <QSet>
#include <QTimer>

#include <KLocalizedString>

namespace Sidekick
{

Cli::Cli(Host *host, SidekickSettings *settings, QObject *parent)
    : QObject(parent)
    , m_host(host)
    , m_settings(settings)
    , m_context(host, &m_prompts)
    , m_registry(new StateRegistry(this))
{
    Q_ASSERT(m_host);
    Q_ASSERT(m_settings);

    reload();
    connect(m_settings, &SidekickSettings::settingsChanged, this, &Cli::reload);
}

Cli::~Cli() = default;

void Cli::reload()
{
    m_tools = ToolRegistry();
    m_tools.load(m_settings->config());

    m_prompts = PromptLibrary();
    m_prompts.load(m_settings->config());
}

void Cli::refresh()
{
    Session::setup();
    m_registry->refresh(m_tools);
}

Filter Cli::normalized(const QString &name, const Filter &filter)
{
    Filter result = filter;
    if (!name.isEmpty()) {
        result.name = name;
    }
    return result;
}

State *Cli::newSession(const QString &name)
{
    NewOptions options;
    options.name = name;
    return newSession(options);
}

State *Cli::newSession(const NewOptions &options)
{
    const QString name = options.name.isEmpty() ? m_settings->defaultTool() : options.name;
    const Tool *tool = m_tools.tool(name);
    if (!tool) {
        m_host->notify(Host::Level::Error, i18n("Unknown tool: %1", name));
        return nullptr;
    }

    // Never try to spawn what is not there
    if (!m_host->isExecutable(tool->executable())) {
        m_host->onMissing(*tool);
        return nullptr;
    }

    Session::setup();

    const QString backend = options.backend.isEmpty() ? m_settings->defaultBackend() : options.backend;
    Session *session = Session::create(*tool, backend);
    if (!session) {
        m_host->notify(Host::Level::Error, i18n("Unknown session backend: %1", backend));
        return nullptr;
    }

    State *state = m_registry->stateFor(session);

    StateRegistry::AttachOptions attachOptions;
    attachOptions.show = true;
    attachOptions.focus = options.focus;
    if (!m_registry->attach(state, attachOptions)) {
        m_host->notify(Host::Level::Error, i18n("Could not start %1", name));
        m_registry->detach(state);
        return nullptr;
    }

    qDebug() << "Cli: started" << name << "on" << backend << "as" << state->sessionId();
    return state;
}

void Cli::show(const QString &name)
{
    ShowOptions options;
    options.name = name;
    show(options);
}

void Cli::show(const ShowOptions &options)
{
    StateRegistry::WithOptions with;
    with.filter = normalized(options.name, options.filter);
    with.all = options.all;
    with.attach = true;
    with.show = true;
    with.focus = options.focus;

    m_registry->with(
        [](State *, bool) {
            return true;
        },
        with);
}

void Cli::hide(const QString &name)
{
    HideOptions options;
    options.name = name;
    hide(options);
}

void Cli::hide(const HideOptions &options)
{
    Filter withTerminal;
    withTerminal.terminal = true;

    StateRegistry::WithOptions with;
    with.filter = normalized(options.name, options.filter).merged(withTerminal);
    with.all = options.all;

    m_registry->with(
        [](State *state, bool) {
            if (!state->terminal()) {
                return false;
            }
            state->terminal()->hide();
            return true;
        },
        with);
}

void Cli::toggle(const QString &name)
{
    ShowOptions options;
    options.name = name;
    toggle(options);
}

void Cli::toggle(const ShowOptions &options)
{
    StateRegistry::WithOptions with;
    with.filter = normalized(options.name, options.filter);
    with.attach = true;

    const bool wantFocus = options.focus.value_or(true);
    m_registry->with(
        [wantFocus](State *state, bool attached) {
            if (!state || !state->terminal()) {
                return false;
            }
            Terminal *terminal = state->terminal();
            // Attaching just created the terminal, it is meant to be seen
            if (attached) {
                terminal->show();
            } else {
                terminal->toggle();
            }
            if (terminal->isOpen() && wantFocus) {
                terminal->focus();
            }
            return true;
        },
        with);
}

void Cli::focus(const QString &name)
{
    ShowOptions options;
    options.name = name;
    focus(options);
}

void Cli::focus(const ShowOptions &options)
{
    StateRegistry::WithOptions with;
    with.filter = normalized(options.name, options.filter);
    with.attach = true;
    with.show = true;
    with.focus = false;

    m_registry->with(
        [](State *state, bool) {
            if (!state || !state->terminal()) {
                return false;
            }
            Terminal *terminal = state->terminal();
            if (terminal->isFocused()) {
                terminal->blur();
            } else {
                terminal->focus();
            }
            return true;
        },
        with);
}

void Cli::close(const QString &name)
{
    HideOptions options;
    options.name = name;
    close(options);
}

void Cli::close(const HideOptions &options)
{
    StateRegistry::WithOptions with;
    with.filter = normalized(options.name, options.filter);
    with.all = options.all;

    m_registry->with(
        [this](State *state, bool) {
            return m_registry->detach(state);
        },
        with);
}

Context::Rendered Cli::render(const QString &templateText) const
{
    return m_context.render(templateText);
}

Context::Rendered Cli::render(const Message &message) const
{
    return m_context.render(message);
}

void Cli::send(const QString &msg)
{
    SendOptions options;
    options.message.msg = msg;
    send(options);
}

void Cli::send(const SendOptions &options)
{
    const Filter filter = normalized(options.name, options.filter);

    Message message = options.message;
    if (!message.msg && !message.prompt && !message.text && m_host->isVisualMode()) {
        message.msg = QStringLiteral("{selection}");
    }

    Text text;
    if (message.text) {
        text = *message.text;
    } else {
        const Context::Rendered rendered = render(message);
        if (rendered.msg.isEmpty() || !rendered.text) {
            m_host->notify(Host::Level::Warning, i18n("Nothing to send."));
            return;
        }
        if (rendered.msg == QLatin1String("\n")) {
            // A lone newline means "send an empty line"
            text = Text();
        } else {
            text = *rendered.text;
        }
    }

    const bool submit = options.submit;
    const std::optional<bool> focus = options.focus;

    StateRegistry::WithOptions with;
    with.filter = filter;
    with.attach = true;
    with.show = true;
    with.focus = focus;

    m_registry->with(
        [this, text, submit, focus, filter](State *state, bool) {
            if (state) {
                m_host->exitVisualMode();
                deliver(state, text, submit);
                return true;
            }

            // Nothing matched, let the user pick where it goes
            Filter pickFilter;
            pickFilter.name = filter.name;

            SelectOptions select;
            select.filter = pickFilter;
            select.focus = focus;
            select.callback = [this, text, submit, focus](State *picked) {
                if (!picked) {
                    return;
                }
                StateRegistry::AttachOptions attachOptions;
                attachOptions.show = true;
                attachOptions.focus = focus;
                if (!m_registry->attach(picked, attachOptions)) {
                    return;
                }
                m_host->exitVisualMode();
                deliver(picked, text, submit);
            };
            this->select(select);
            return true;
        },
        with);
}

void Cli::deliver(State *state, const Text &text, bool submit)
{
    QPointer<State> guard(state);
    QTimer::singleShot(0, this, [this, guard, text, submit]() {
        if (!guard || !m_registry->contains(guard)) {
            qDebug() << "Cli: session went away before delivery";
            return;
        }
        Session *session = guard->session();
        if (!session || !session->isAlive()) {
            qWarning() << "Cli:" << guard->sessionId() << "is not running, message dropped";
            return;
        }

        const QString payload = guard->tool().format(text) + QLatin1Char('\n');
        if (!session->send(payload)) {
            return;
        }
        if (submit) {
            session->submit();
        }
        Q_EMIT delivered(session->id(), payload);
    });
}

void Cli::mySend(const QString &msg)
{
    SendOptions options;
    options.message.msg = msg;
    mySend(options);
}

void Cli::mySend(const SendOptions &options)
{
    SendOptions opts = options;
    opts.filter = normalized(opts.name, opts.filter);
    opts.name.clear();

    Filter attachedOnly;
    attachedOnly.attached = true;
    if (!m_registry->get(opts.filter.merged(attachedOnly)).isEmpty()) {
        send(opts);
        return;
    }

    NewOptions newOptions;
    newOptions.name = opts.filter.name.value_or(QString());
    newOptions.focus = opts.focus;
    State *state = newSession(newOptions);
    if (!state) {
        return;
    }

    // Send to the session just started, not whatever matches later
    opts.filter.session = state->sessionId();
    state->session()->whenReady(m_settings->sendGraceMs(), [this, opts]() {
        send(opts);
    });
}

void Cli::prompt(const PromptCallback &callback)
{
    PromptOptions options;
    options.callback = callback;
    prompt(options);
}

void Cli::prompt(const PromptOptions &options)
{
    PromptCallback callback = options.callback;
    if (!callback) {
        const QString name = options.name;
        const std::optional<bool> focus = options.focus;
        callback = [this, name, focus](const QString &, const std::optional<Text> &text) {
            if (!text) {
                return;
            }
            SendOptions send;
            send.name = name;
            send.focus = focus;
            send.message.text = text;
            this->send(send);
        };
    }

    QPointer<Cli> guard(this);
    m_host->selectPrompt(m_prompts.names(), [guard, callback](const QString &promptName) {
        if (!guard || promptName.isEmpty()) {
            return;
        }
        Message message;
        message.prompt = promptName;
        const Context::Rendered rendered = guard->render(message);
        if (rendered.msg.isEmpty() || !rendered.text) {
            callback(QString(), std::nullopt);
            return;
        }
        callback(rendered.msg, rendered.text);
    });
}

void Cli::myPrompt(const PromptOptions &options)
{
    Filter filter;
    filter.attached = true;
    if (!options.name.isEmpty()) {
        filter.name = options.name;
    }

    if (!m_registry->get(filter).isEmpty()) {
        prompt(options);
        return;
    }

    NewOptions newOptions;
    newOptions.name = options.name;
    newOptions.focus = options.focus;
    State *state = newSession(newOptions);
    if (!state) {
        return;
    }

    PromptOptions opts = options;
    if (opts.name.isEmpty()) {
        opts.name = state->name();
    }
    state->session()->whenReady(m_settings->promptGraceMs(), [this, opts]() {
        prompt(opts);
    });
}

void Cli::select(const SelectCallback &callback)
{
    SelectOptions options;
    options.callback = callback;
    select(options);
}

void Cli::select(const SelectOptions &options)
{
    SelectCallback callback = options.callback;
    if (!callback) {
        const std::optional<bool> focus = options.focus;
        callback = [this, focus](State *state) {
            if (!state) {
                return;
            }
            StateRegistry::AttachOptions attachOptions;
            attachOptions.show = true;
            attachOptions.focus = focus;
            m_registry->attach(state, attachOptions);
        };
    }

    const QList<State *> states = m_registry->get(options.filter);

    // Offer the tools that are installed
    QStringList toolNames;
    const QList<Tool> tools = m_tools.tools();
    for (const Tool &tool : tools) {
        if (options.filter.name && tool.name != *options.filter.name) {
            continue;
        }
        if (m_host->isExecutable(tool.executable())) {
            toolNames.append(tool.name);
        }
    }

    QPointer<Cli> guard(this);
    const std::optional<bool> focus = options.focus;
    m_host->selectSession(states, toolNames, [guard, callback, focus](const Host::Selection &selection) {
        if (!guard) {
            return;
        }
        State *state = nullptr;
        if (selection.state && guard->m_registry->contains(selection.state)) {
            state = selection.state;
        } else if (!selection.toolName.isEmpty()) {
            NewOptions newOptions;
            newOptions.name = selection.toolName;
            newOptions.focus = focus;
            state = guard->newSession(newOptions);
        }
        callback(state);
    });
}

void Cli::deprecate(const QString &oldName, const QString &newName)
{
    static QSet<QString> s_warned;
    if (s_warned.contains(oldName)) {
        return;
    }
    s_warned.insert(oldName);
    m_host->notify(Host::Level::Warning, i18n("%1 is deprecated, use %2 instead.", oldName, newName));
}

void Cli::selectPrompt(const PromptOptions &options)
{
    deprecate(QStringLiteral("selectPrompt()"), QStringLiteral("prompt()"));
    prompt(options);
}

void Cli::selectTool(const SelectOptions &options)
{
    deprecate(QStringLiteral("selectTool()"), QStringLiteral("select()"));
    select(options);
}

void Cli::ask(const QString &msg)
{
    SendOptions options;
    options.message.msg = msg;
    ask(options);
}

void Cli::ask(const SendOptions &options)
{
    deprecate(QStringLiteral("ask()"), QStringLiteral("send()"));
    send(options);
}

} // namespace Sidekick

#include "moc_Cli.cpp"
