// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#pragma once

#include <QObject>
#include <QString>

/**
 * SettingsManager - Manages application settings persistence
 * 
 * Stores settings in ~/.config/devtrayrc using KSharedConfig.
 * All settings are automatically persisted when changed.
 */
class SettingsManager : public QObject
{
    Q_OBJECT

    // General settings
    Q_PROPERTY(int debounceInterval READ debounceInterval WRITE setDebounceInterval NOTIFY debounceIntervalChanged)
    Q_PROPERTY(QString defaultIcon READ defaultIcon WRITE setDefaultIcon NOTIFY defaultIconChanged)

    // qubesd connection settings
    Q_PROPERTY(QString qubesdSocket READ qubesdSocket WRITE setQubesdSocket NOTIFY qubesdSocketChanged)
    Q_PROPERTY(int callTimeout READ callTimeout WRITE setCallTimeout NOTIFY callTimeoutChanged)
    Q_PROPERTY(int reconnectDelay READ reconnectDelay WRITE setReconnectDelay NOTIFY reconnectDelayChanged)

public:
    static constexpr int DefaultDebounceInterval = 5000;
    static constexpr int DefaultCallTimeout = 10000;
    static constexpr int DefaultReconnectDelay = 1000;

    /**
     * @param configName KConfig file name, relative to the user config directory
     */
    explicit SettingsManager(const QString &configName = QStringLiteral("devtrayrc"),
                             QObject *parent = nullptr);
    ~SettingsManager() override = default;

    // General settings

    /**
     * How long (ms) a device stays in a "recently added/removed" batch
     */
    int debounceInterval() const { return m_debounceInterval; }
    void setDebounceInterval(int value);

    /**
     * Icon used when a VM's icon or label cannot be read
     */
    QString defaultIcon() const { return m_defaultIcon; }
    void setDefaultIcon(const QString &value);

    // qubesd connection settings
    QString qubesdSocket() const { return m_qubesdSocket; }
    void setQubesdSocket(const QString &value);

    int callTimeout() const { return m_callTimeout; }
    void setCallTimeout(int value);

    int reconnectDelay() const { return m_reconnectDelay; }
    void setReconnectDelay(int value);

    /**
     * Reset all settings to defaults
     */
    void resetToDefaults();

Q_SIGNALS:
    void debounceIntervalChanged();
    void defaultIconChanged();
    void qubesdSocketChanged();
    void callTimeoutChanged();
    void reconnectDelayChanged();

private:
    void loadSettings();
    void saveSettings();

    QString m_configName;

    // General settings
    int m_debounceInterval = DefaultDebounceInterval;
    QString m_defaultIcon = QStringLiteral("appvm-black");

    // qubesd connection settings
    QString m_qubesdSocket = QStringLiteral("/var/run/qubesd.sock");
    int m_callTimeout = DefaultCallTimeout;
    int m_reconnectDelay = DefaultReconnectDelay;
};
