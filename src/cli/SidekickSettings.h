/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SIDEKICK_SETTINGS_H
#define SIDEKICK_SETTINGS_H

#include "sidekick_export.h"

#include <QObject>
#include <QString>

#include <KSharedConfig>

namespace Sidekick
{

/**
 * SidekickSettings manages application-wide settings.
 *
 * Settings live in ~/.config/sidekickrc:
 * - [General] defaults for new sessions and delivery grace periods
 * - [Tool NAME] tool overrides, read by ToolRegistry
 * - [Prompts] user prompts, read by PromptLibrary
 */
class SIDEKICK_EXPORT SidekickSettings : public QObject
{
    Q_OBJECT

public:
    explicit SidekickSettings(QObject *parent = nullptr);

    /**
     * Use an explicit config (tests, embedders with their own rc file)
     */
    explicit SidekickSettings(const KSharedConfig::Ptr &config, QObject *parent = nullptr);
    ~SidekickSettings() override;

    /**
     * Tool used when a command names none (default: claude)
     */
    QString defaultTool() const;
    void setDefaultTool(const QString &name);

    /**
     * Backend used for new sessions: "tmux" or "process" (default: tmux)
     */
    QString defaultBackend() const;

    /**
     * A non-persistent value lasts until the config is reloaded
     */
    void setDefaultBackend(const QString &backend, bool persistent = true);

    /**
     * Wait before the first message reaches a freshly started session
     */
    int sendGraceMs() const;
    void setSendGraceMs(int ms);

    /**
     * Wait before the prompt picker opens for a freshly started session
     */
    int promptGraceMs() const;
    void setPromptGraceMs(int ms);

    /**
     * Terminal emulator prefix used by ExternalTerminal,
     * the attach command is appended (default: "x-terminal-emulator -e")
     */
    QString terminalCommand() const;
    void setTerminalCommand(const QString &command);

    KSharedConfig::Ptr config() const
    {
        return m_config;
    }

    /**
     * Save settings to disk
     */
    void save();

Q_SIGNALS:
    void settingsChanged();

private:
    KSharedConfig::Ptr m_config;
};

} // namespace Sidekick

#endif // SIDEKICK_SETTINGS_H
