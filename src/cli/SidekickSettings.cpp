/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SidekickSettings.h"

#include <KConfigGroup>

namespace Sidekick
{

SidekickSettings::SidekickSettings(QObject *parent)
    : SidekickSettings(KSharedConfig::openConfig(QStringLiteral("sidekickrc")), parent)
{
}

SidekickSettings::SidekickSettings(const KSharedConfig::Ptr &config, QObject *parent)
    : QObject(parent)
    , m_config(config)
{
}

SidekickSettings::~SidekickSettings()
{
    save();
}

QString SidekickSettings::defaultTool() const
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    return group.readEntry("DefaultTool", QStringLiteral("claude"));
}

void SidekickSettings::setDefaultTool(const QString &name)
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    group.writeEntry("DefaultTool", name);
    Q_EMIT settingsChanged();
}

QString SidekickSettings::defaultBackend() const
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    return group.readEntry("DefaultBackend", QStringLiteral("tmux"));
}

void SidekickSettings::setDefaultBackend(const QString &backend, bool persistent)
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    group.writeEntry("DefaultBackend", backend, persistent ? KConfigBase::Normal : KConfigBase::WriteConfigFlags());
    Q_EMIT settingsChanged();
}

int SidekickSettings::sendGraceMs() const
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    return qMax(0, group.readEntry("SendGraceMs", 2000));
}

void SidekickSettings::setSendGraceMs(int ms)
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    group.writeEntry("SendGraceMs", ms);
    Q_EMIT settingsChanged();
}

int SidekickSettings::promptGraceMs() const
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    return qMax(0, group.readEntry("PromptGraceMs", 500));
}

void SidekickSettings::setPromptGraceMs(int ms)
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    group.writeEntry("PromptGraceMs", ms);
    Q_EMIT settingsChanged();
}

QString SidekickSettings::terminalCommand() const
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    return group.readEntry("TerminalCommand", QStringLiteral("x-terminal-emulator -e"));
}

void SidekickSettings::setTerminalCommand(const QString &command)
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    group.writeEntry("TerminalCommand", command);
    Q_EMIT settingsChanged();
}

void SidekickSettings::save()
{
    m_config->sync();
}

} // namespace Sidekick

#include "moc_SidekickSettings.cpp"
