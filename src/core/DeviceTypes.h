// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#pragma once

#include <QHash>
#include <QList>
#include <QMetaType>
#include <QSet>
#include <QString>
#include <QVariantMap>

/**
 * @brief Device classes tracked by the tray
 *
 * Devices of any other class reported by qubesd are ignored.
 */
enum class DeviceClass {
    Block,
    Usb,
    Mic,
};

/**
 * @brief All tracked device classes, in menu order
 */
const QList<DeviceClass> &allDeviceClasses();

/**
 * @brief qubesd name of a device class ("block", "usb", "mic")
 */
QString deviceClassName(DeviceClass devclass);

/**
 * @brief Parse a qubesd device class name
 * @return false if @p name is not one of the tracked classes
 */
bool parseDeviceClass(const QString &name, DeviceClass *devclass);

/**
 * @brief Canonical identity of a device: backend VM plus ident
 *
 * Used for every internal lookup. The string form "backend:ident" is the one
 * qubesd uses in event payloads; "backend+ident" is the admin call argument form.
 */
struct DeviceKey {
    QString backendDomain;
    QString ident;

    bool isValid() const { return !backendDomain.isEmpty() && !ident.isEmpty(); }

    QString toString() const;
    QString toCallArgument() const;

    /**
     * @brief Parse "backend:ident"
     * @return invalid key if @p text has no separator
     */
    static DeviceKey fromString(const QString &text);

    bool operator==(const DeviceKey &other) const
    {
        return backendDomain == other.backendDomain && ident == other.ident;
    }
    bool operator!=(const DeviceKey &other) const { return !(*this == other); }
    bool operator<(const DeviceKey &other) const
    {
        if (backendDomain != other.backendDomain) {
            return backendDomain < other.backendDomain;
        }
        return ident < other.ident;
    }
};

size_t qHash(const DeviceKey &key, size_t seed = 0) noexcept;

/**
 * @brief A device as reported by a backend VM's device listing
 */
struct DeviceInfo {
    DeviceKey key;
    DeviceClass devclass = DeviceClass::Usb;
    QString description;
    QVariantMap data;
};

/**
 * @brief Registry record for a device
 *
 * The key never changes after construction. @c vmIcon is the backend VM's icon,
 * resolved once when the record is built.
 */
struct Device {
    DeviceKey key;
    DeviceClass devclass = DeviceClass::Usb;
    QString description = QStringLiteral("unknown");
    QVariantMap data;
    QSet<QString> attachments; // names of VMs the device is attached to
    QString vmIcon;

    QString backendDomain() const { return key.backendDomain; }
    QString ident() const { return key.ident; }

    static Device fromInfo(const DeviceInfo &info, const QString &vmIcon);

    bool operator==(const Device &other) const { return key == other.key; }
};

/**
 * @brief A tracked (running, non-administrative) VM
 */
struct Domain {
    QString name;
    QString icon;

    bool operator==(const Domain &other) const { return name == other.name; }
    bool operator<(const Domain &other) const { return name < other.name; }
};

Q_DECLARE_METATYPE(DeviceKey)
Q_DECLARE_METATYPE(Device)
