#pragma once

#include <QSettings>
#include "version.h"

namespace SideCapture {

inline constexpr const char* kOrganizationName = "SideCapture";
inline constexpr const char* kApplicationName = SIDECAPTURE_APP_NAME;

inline bool isDebugSettingsNamespace()
{
    return QString::fromLatin1(SIDECAPTURE_APP_ID).endsWith(QStringLiteral(".debug"));
}

inline QSettings getSettings()
{
    if (isDebugSettingsNamespace()) {
        return QSettings(kOrganizationName, QString::fromLatin1(kApplicationName) + QStringLiteral("-Debug"));
    }
    return QSettings(kOrganizationName, kApplicationName);
}

} // namespace SideCapture
