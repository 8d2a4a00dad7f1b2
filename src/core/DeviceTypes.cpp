// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#include "DeviceTypes.h"

const QList<DeviceClass> &allDeviceClasses()
{
    static const QList<DeviceClass> classes = {
        DeviceClass::Block,
        DeviceClass::Usb,
        DeviceClass::Mic,
    };
    return classes;
}

QString deviceClassName(DeviceClass devclass)
{
    switch (devclass) {
    case DeviceClass::Block:
        return QStringLiteral("block");
    case DeviceClass::Usb:
        return QStringLiteral("usb");
    case DeviceClass::Mic:
        return QStringLiteral("mic");
    }
    return QString();
}

bool parseDeviceClass(const QString &name, DeviceClass *devclass)
{
    for (DeviceClass candidate : allDeviceClasses()) {
        if (deviceClassName(candidate) == name) {
            if (devclass) {
                *devclass = candidate;
            }
            return true;
        }
    }
    return false;
}

QString DeviceKey::toString() const
{
    return backendDomain + QLatin1Char(':') + ident;
}

QString DeviceKey::toCallArgument() const
{
    return backendDomain + QLatin1Char('+') + ident;
}

DeviceKey DeviceKey::fromString(const QString &text)
{
    const int separator = text.indexOf(QLatin1Char(':'));
    if (separator <= 0) {
        return DeviceKey();
    }
    return DeviceKey{text.left(separator), text.mid(separator + 1)};
}

size_t qHash(const DeviceKey &key, size_t seed) noexcept
{
    return qHashMulti(seed, key.backendDomain, key.ident);
}

Device Device::fromInfo(const DeviceInfo &info, const QString &vmIcon)
{
    Device device;
    device.key = info.key;
    device.devclass = info.devclass;
    if (!info.description.isEmpty()) {
        device.description = info.description;
    }
    device.data = info.data;
    device.vmIcon = vmIcon;
    return device;
}
