// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#include "SettingsManager.h"
#include "Logging.h"

#include <KSharedConfig>
#include <KConfigGroup>

SettingsManager::SettingsManager(const QString &configName, QObject *parent)
    : QObject(parent)
    , m_configName(configName)
{
    loadSettings();
}

void SettingsManager::loadSettings()
{
    KSharedConfig::Ptr config = KSharedConfig::openConfig(m_configName);
    
    // General settings
    KConfigGroup general = config->group(QStringLiteral("General"));
    m_debounceInterval = general.readEntry(QStringLiteral("DebounceInterval"), DefaultDebounceInterval);
    m_defaultIcon = general.readEntry(QStringLiteral("DefaultIcon"), QStringLiteral("appvm-black"));
    
    // qubesd connection settings
    KConfigGroup qubesd = config->group(QStringLiteral("Qubesd"));
    m_qubesdSocket = qubesd.readEntry(QStringLiteral("Socket"), QStringLiteral("/var/run/qubesd.sock"));
    m_callTimeout = qubesd.readEntry(QStringLiteral("CallTimeout"), DefaultCallTimeout);
    m_reconnectDelay = qubesd.readEntry(QStringLiteral("ReconnectDelay"), DefaultReconnectDelay);

    if (m_debounceInterval <= 0) {
        qCWarning(devtrayCore) << "SettingsManager: Ignoring invalid DebounceInterval" << m_debounceInterval;
        m_debounceInterval = DefaultDebounceInterval;
    }
    
    qCDebug(devtrayCore) << "SettingsManager: Loaded settings from" << m_configName;
}

void SettingsManager::saveSettings()
{
    KSharedConfig::Ptr config = KSharedConfig::openConfig(m_configName);
    
    // General settings
    KConfigGroup general = config->group(QStringLiteral("General"));
    general.writeEntry(QStringLiteral("DebounceInterval"), m_debounceInterval);
    general.writeEntry(QStringLiteral("DefaultIcon"), m_defaultIcon);
    
    // qubesd connection settings
    KConfigGroup qubesd = config->group(QStringLiteral("Qubesd"));
    qubesd.writeEntry(QStringLiteral("Socket"), m_qubesdSocket);
    qubesd.writeEntry(QStringLiteral("CallTimeout"), m_callTimeout);
    qubesd.writeEntry(QStringLiteral("ReconnectDelay"), m_reconnectDelay);
    
    config->sync();
}

void SettingsManager::setDebounceInterval(int value)
{
    if (value <= 0) {
        return;
    }
    if (m_debounceInterval != value) {
        m_debounceInterval = value;
        saveSettings();
        Q_EMIT debounceIntervalChanged();
    }
}

void SettingsManager::setDefaultIcon(const QString &value)
{
    if (m_defaultIcon != value) {
        m_defaultIcon = value;
        saveSettings();
        Q_EMIT defaultIconChanged();
    }
}

void SettingsManager::setQubesdSocket(const QString &value)
{
    if (m_qubesdSocket != value) {
        m_qubesdSocket = value;
        saveSettings();
        Q_EMIT qubesdSocketChanged();
    }
}

void SettingsManager::setCallTimeout(int value)
{
    if (m_callTimeout != value) {
        m_callTimeout = value;
        saveSettings();
        Q_EMIT callTimeoutChanged();
    }
}

void SettingsManager::setReconnectDelay(int value)
{
    if (m_reconnectDelay != value) {
        m_reconnectDelay = value;
        saveSettings();
        Q_EMIT reconnectDelayChanged();
    }
}

void SettingsManager::resetToDefaults()
{
    m_debounceInterval = DefaultDebounceInterval;
    m_defaultIcon = QStringLiteral("appvm-black");
    m_qubesdSocket = QStringLiteral("/var/run/qubesd.sock");
    m_callTimeout = DefaultCallTimeout;
    m_reconnectDelay = DefaultReconnectDelay;
    
    saveSettings();
    
    Q_EMIT debounceIntervalChanged();
    Q_EMIT defaultIconChanged();
    Q_EMIT qubesdSocketChanged();
    Q_EMIT callTimeoutChanged();
    Q_EMIT reconnectDelayChanged();
    
    qCDebug(devtrayCore) << "SettingsManager: Reset all settings to defaults";
}
