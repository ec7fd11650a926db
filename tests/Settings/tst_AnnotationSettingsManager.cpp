#include <QtTest>
#include <QSettings>
#include <QColor>
#include "settings/AnnotationSettingsManager.h"
#include "settings/Settings.h"

/**
 * @brief Unit tests for AnnotationSettingsManager singleton class.
 *
 * Tests settings persistence including:
 * - Singleton pattern
 * - Color and width with validation
 * - Fill mode
 * - Last selected tool, stored by name
 */
class tst_AnnotationSettingsManager : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // Singleton tests
    void testSingletonInstance();

    // Color settings tests
    void testLoadColor_DefaultValue();
    void testSaveLoadColor_Roundtrip();
    void testSaveLoadColor_ARGB();
    void testLoadColor_InvalidValue();

    // Width settings tests
    void testLoadWidth_DefaultValue();
    void testSaveLoadWidth_Roundtrip();
    void testSaveLoadWidth_BoundaryValues();
    void testLoadWidth_InvalidValue();

    // Fill mode tests
    void testLoadFilled_DefaultValue();
    void testSaveLoadFilled_Roundtrip();

    // Tool type tests
    void testLoadToolType_DefaultValue();
    void testSaveLoadToolType_AllValues();
    void testSaveToolType_StoredByName();
    void testLoadToolType_InvalidValue();

private:
    void clearAllTestSettings();
};

void tst_AnnotationSettingsManager::init()
{
    clearAllTestSettings();
}

void tst_AnnotationSettingsManager::cleanup()
{
    clearAllTestSettings();
}

void tst_AnnotationSettingsManager::clearAllTestSettings()
{
    auto settings = SideCapture::getSettings();
    settings.remove("annotation/color");
    settings.remove("annotation/width");
    settings.remove("annotation/filled");
    settings.remove("annotation/tool");
    settings.sync();
}

// ============================================================================
// Singleton tests
// ============================================================================

void tst_AnnotationSettingsManager::testSingletonInstance()
{
    AnnotationSettingsManager& instance1 = AnnotationSettingsManager::instance();
    AnnotationSettingsManager& instance2 = AnnotationSettingsManager::instance();

    QCOMPARE(&instance1, &instance2);
}

// ============================================================================
// Color settings tests
// ============================================================================

void tst_AnnotationSettingsManager::testLoadColor_DefaultValue()
{
    QColor color = AnnotationSettingsManager::instance().loadColor();
    QCOMPARE(color, QColor(Qt::red));
}

void tst_AnnotationSettingsManager::testSaveLoadColor_Roundtrip()
{
    AnnotationSettingsManager& manager = AnnotationSettingsManager::instance();

    QColor testColor(0, 128, 255);
    manager.saveColor(testColor);

    QCOMPARE(manager.loadColor(), testColor);
}

void tst_AnnotationSettingsManager::testSaveLoadColor_ARGB()
{
    AnnotationSettingsManager& manager = AnnotationSettingsManager::instance();

    QColor translucent(10, 20, 30, 128);
    manager.saveColor(translucent);

    QColor loaded = manager.loadColor();
    QCOMPARE(loaded.alpha(), 128);
    QCOMPARE(loaded.rgb(), translucent.rgb());
}

void tst_AnnotationSettingsManager::testLoadColor_InvalidValue()
{
    auto settings = SideCapture::getSettings();
    settings.setValue("annotation/color", "definitely-not-a-color");
    settings.sync();

    QCOMPARE(AnnotationSettingsManager::instance().loadColor(), AnnotationSettingsManager::defaultColor());
}

// ============================================================================
// Width settings tests
// ============================================================================

void tst_AnnotationSettingsManager::testLoadWidth_DefaultValue()
{
    QCOMPARE(AnnotationSettingsManager::instance().loadWidth(), AnnotationSettingsManager::kDefaultWidth);
}

void tst_AnnotationSettingsManager::testSaveLoadWidth_Roundtrip()
{
    AnnotationSettingsManager& manager = AnnotationSettingsManager::instance();
    manager.saveWidth(7);
    QCOMPARE(manager.loadWidth(), 7);
}

void tst_AnnotationSettingsManager::testSaveLoadWidth_BoundaryValues()
{
    AnnotationSettingsManager& manager = AnnotationSettingsManager::instance();

    manager.saveWidth(AnnotationSettingsManager::kMinWidth);
    QCOMPARE(manager.loadWidth(), AnnotationSettingsManager::kMinWidth);

    manager.saveWidth(AnnotationSettingsManager::kMaxWidth);
    QCOMPARE(manager.loadWidth(), AnnotationSettingsManager::kMaxWidth);

    manager.saveWidth(0);
    QCOMPARE(manager.loadWidth(), AnnotationSettingsManager::kMinWidth);

    manager.saveWidth(1000);
    QCOMPARE(manager.loadWidth(), AnnotationSettingsManager::kMaxWidth);
}

void tst_AnnotationSettingsManager::testLoadWidth_InvalidValue()
{
    auto settings = SideCapture::getSettings();
    settings.setValue("annotation/width", "thick");
    settings.sync();

    QCOMPARE(AnnotationSettingsManager::instance().loadWidth(), AnnotationSettingsManager::kDefaultWidth);
}

// ============================================================================
// Fill mode tests
// ============================================================================

void tst_AnnotationSettingsManager::testLoadFilled_DefaultValue()
{
    QVERIFY(!AnnotationSettingsManager::instance().loadFilled());
}

void tst_AnnotationSettingsManager::testSaveLoadFilled_Roundtrip()
{
    AnnotationSettingsManager& manager = AnnotationSettingsManager::instance();
    manager.saveFilled(true);
    QVERIFY(manager.loadFilled());
    manager.saveFilled(false);
    QVERIFY(!manager.loadFilled());
}

// ============================================================================
// Tool type tests
// ============================================================================

void tst_AnnotationSettingsManager::testLoadToolType_DefaultValue()
{
    QCOMPARE(AnnotationSettingsManager::instance().loadToolType(), AnnotationToolType::Rectangle);
}

void tst_AnnotationSettingsManager::testSaveLoadToolType_AllValues()
{
    AnnotationSettingsManager& manager = AnnotationSettingsManager::instance();

    const AnnotationToolType types[] = {
        AnnotationToolType::Arrow,
        AnnotationToolType::Rectangle,
        AnnotationToolType::Circle,
        AnnotationToolType::Line,
        AnnotationToolType::Text,
        AnnotationToolType::Highlighter,
        AnnotationToolType::FreeDraw
    };
    for (AnnotationToolType type : types) {
        manager.saveToolType(type);
        QCOMPARE(manager.loadToolType(), type);
    }
}

void tst_AnnotationSettingsManager::testSaveToolType_StoredByName()
{
    AnnotationSettingsManager::instance().saveToolType(AnnotationToolType::Highlighter);

    auto settings = SideCapture::getSettings();
    QCOMPARE(settings.value("annotation/tool").toString(), QStringLiteral("highlighter"));
}

void tst_AnnotationSettingsManager::testLoadToolType_InvalidValue()
{
    auto settings = SideCapture::getSettings();
    settings.setValue("annotation/tool", "mosaic");
    settings.sync();

    QCOMPARE(AnnotationSettingsManager::instance().loadToolType(),
             AnnotationSettingsManager::kDefaultToolType);
}

QTEST_MAIN(tst_AnnotationSettingsManager)
#include "tst_AnnotationSettingsManager.moc"
