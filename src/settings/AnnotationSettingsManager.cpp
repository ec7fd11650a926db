#include "settings/AnnotationSettingsManager.h"
#include "settings/Settings.h"
#include <QSettings>

AnnotationSettingsManager& AnnotationSettingsManager::instance()
{
    static AnnotationSettingsManager instance;
    return instance;
}

QColor AnnotationSettingsManager::loadColor() const
{
    auto settings = SideCapture::getSettings();
    QColor color = settings.value(kSettingsKeyColor, defaultColor()).value<QColor>();
    return color.isValid() ? color : defaultColor();
}

void AnnotationSettingsManager::saveColor(const QColor& color)
{
    auto settings = SideCapture::getSettings();
    settings.setValue(kSettingsKeyColor, color);
}

int AnnotationSettingsManager::loadWidth() const
{
    auto settings = SideCapture::getSettings();
    bool ok = false;
    int width = settings.value(kSettingsKeyWidth, kDefaultWidth).toInt(&ok);
    if (!ok) {
        return kDefaultWidth;
    }
    return qBound(kMinWidth, width, kMaxWidth);
}

void AnnotationSettingsManager::saveWidth(int width)
{
    auto settings = SideCapture::getSettings();
    settings.setValue(kSettingsKeyWidth, qBound(kMinWidth, width, kMaxWidth));
}

bool AnnotationSettingsManager::loadFilled() const
{
    auto settings = SideCapture::getSettings();
    return settings.value(kSettingsKeyFilled, kDefaultFilled).toBool();
}

void AnnotationSettingsManager::saveFilled(bool filled)
{
    auto settings = SideCapture::getSettings();
    settings.setValue(kSettingsKeyFilled, filled);
}

AnnotationToolType AnnotationSettingsManager::loadToolType() const
{
    auto settings = SideCapture::getSettings();
    const QString name = settings.value(kSettingsKeyToolType, toolTypeName(kDefaultToolType)).toString();

    AnnotationToolType type = kDefaultToolType;
    if (!toolTypeFromName(name, &type)) {
        return kDefaultToolType;
    }
    return type;
}

void AnnotationSettingsManager::saveToolType(AnnotationToolType type)
{
    auto settings = SideCapture::getSettings();
    settings.setValue(kSettingsKeyToolType, toolTypeName(type));
}
