#ifndef ANNOTATIONSETTINGSMANAGER_H
#define ANNOTATIONSETTINGSMANAGER_H

#include <QColor>
#include "annotations/AnnotationTool.h"

/**
 * @brief Singleton class for managing annotation settings.
 *
 * Remembers the drawing color, stroke width, fill mode and tool the user
 * last picked in the annotation editor.
 */
class AnnotationSettingsManager
{
public:
    static AnnotationSettingsManager& instance();

    // Color settings
    QColor loadColor() const;
    void saveColor(const QColor& color);

    // Width settings
    int loadWidth() const;
    void saveWidth(int width);

    // Fill mode for rectangle and circle
    bool loadFilled() const;
    void saveFilled(bool filled);

    // Last selected tool
    AnnotationToolType loadToolType() const;
    void saveToolType(AnnotationToolType type);

    // Default values
    static constexpr int kDefaultWidth = 2;
    static constexpr int kMinWidth = 1;
    static constexpr int kMaxWidth = 50;
    static QColor defaultColor() { return Qt::red; }
    static constexpr bool kDefaultFilled = false;
    static constexpr AnnotationToolType kDefaultToolType = AnnotationToolType::Rectangle;

private:
    AnnotationSettingsManager() = default;
    AnnotationSettingsManager(const AnnotationSettingsManager&) = delete;
    AnnotationSettingsManager& operator=(const AnnotationSettingsManager&) = delete;

    static constexpr const char* kSettingsKeyColor = "annotation/color";
    static constexpr const char* kSettingsKeyWidth = "annotation/width";
    static constexpr const char* kSettingsKeyFilled = "annotation/filled";
    static constexpr const char* kSettingsKeyToolType = "annotation/tool";
};

#endif // ANNOTATIONSETTINGSMANAGER_H
