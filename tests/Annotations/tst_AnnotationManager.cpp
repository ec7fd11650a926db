#include <QtTest/QtTest>
#include <QPainter>
#include <QImage>
#include <QSignalSpy>
#include "annotations/AnnotationManager.h"
#include "annotations/AllAnnotationTools.h"

namespace {

// Appends its id to a shared log whenever it is rendered
class RecordingTool : public AnnotationTool
{
public:
    RecordingTool(int id, QVector<int> *log)
        : AnnotationTool(DrawStyle())
        , m_id(id)
        , m_log(log)
    {
    }

    AnnotationToolType type() const override { return AnnotationToolType::Rectangle; }
    void render(QPainter &painter) const override
    {
        Q_UNUSED(painter);
        m_log->append(m_id);
    }
    QRect boundingRect() const override { return QRect(); }
    bool hasAnchor() const override { return m_anchored; }

protected:
    void onStart(const QPoint &) override { m_anchored = true; }
    void onUpdate(const QPoint &) override {}

private:
    int m_id;
    QVector<int> *m_log;
    bool m_anchored = false;
};

std::unique_ptr<RecordingTool> committedTool(int id, QVector<int> *log)
{
    auto tool = std::make_unique<RecordingTool>(id, log);
    tool->startDrawing(QPoint(0, 0));
    tool->finishDrawing(QPoint(1, 1));
    return tool;
}

} // namespace

/**
 * @brief Tests for AnnotationManager
 *
 * Covers:
 * - Insertion order as paint order
 * - Current tool painted above committed annotations
 * - Undo and clear
 * - Committing the current tool
 * - Compositing onto images
 */
class TestAnnotationManager : public QObject
{
    Q_OBJECT

private slots:
    // List tests
    void testAddAnnotation_IncreasesCount();
    void testAddAnnotation_NullIgnored();
    void testAnnotationAt_OutOfRange();

    // Undo / clear tests
    void testUndo_RemovesLastAdded();
    void testUndo_EmptyReturnsFalse();
    void testClearAll();

    // Render order tests
    void testRenderAll_InsertionOrder();
    void testRenderAll_CurrentToolLastWhileDrawing();
    void testRenderAll_FinishedCurrentToolNotRendered();

    // Current tool tests
    void testCommitCurrentTool_WhenFinished();
    void testCommitCurrentTool_StillDrawing();
    void testTakeCurrentTool();

    // Signal tests
    void testChangedSignal();
    void testChangedSignal_TakeCurrentTool();

    // Compositing tests
    void testRenderedCopy_LeavesBaseUntouched();
    void testRenderOnto_NullImage();
};

// ============================================================================
// List Tests
// ============================================================================

void TestAnnotationManager::testAddAnnotation_IncreasesCount()
{
    AnnotationManager manager;
    QVector<int> log;
    QVERIFY(!manager.hasAnnotations());

    manager.addAnnotation(committedTool(1, &log));
    manager.addAnnotation(committedTool(2, &log));

    QCOMPARE(manager.annotationCount(), 2);
    QVERIFY(manager.hasAnnotations());
}

void TestAnnotationManager::testAddAnnotation_NullIgnored()
{
    AnnotationManager manager;
    QSignalSpy spy(&manager, &AnnotationManager::changed);

    manager.addAnnotation(nullptr);

    QCOMPARE(manager.annotationCount(), 0);
    QCOMPARE(spy.count(), 0);
}

void TestAnnotationManager::testAnnotationAt_OutOfRange()
{
    AnnotationManager manager;
    QVector<int> log;
    manager.addAnnotation(committedTool(1, &log));

    QVERIFY(manager.annotationAt(0) != nullptr);
    QVERIFY(manager.annotationAt(-1) == nullptr);
    QVERIFY(manager.annotationAt(1) == nullptr);
}

// ============================================================================
// Undo / Clear Tests
// ============================================================================

void TestAnnotationManager::testUndo_RemovesLastAdded()
{
    AnnotationManager manager;
    QVector<int> log;
    manager.addAnnotation(committedTool(1, &log));
    manager.addAnnotation(committedTool(2, &log));
    manager.addAnnotation(committedTool(3, &log));

    QVERIFY(manager.undo());
    QCOMPARE(manager.annotationCount(), 2);

    QImage image(10, 10, QImage::Format_ARGB32_Premultiplied);
    manager.renderOnto(image);
    QCOMPARE(log, QVector<int>({ 1, 2 }));
}

void TestAnnotationManager::testUndo_EmptyReturnsFalse()
{
    AnnotationManager manager;
    QSignalSpy spy(&manager, &AnnotationManager::changed);

    QVERIFY(!manager.undo());
    QCOMPARE(spy.count(), 0);
}

void TestAnnotationManager::testClearAll()
{
    AnnotationManager manager;
    QVector<int> log;
    manager.addAnnotation(committedTool(1, &log));
    manager.addAnnotation(committedTool(2, &log));

    manager.clearAll();

    QCOMPARE(manager.annotationCount(), 0);
    QVERIFY(!manager.undo());
}

// ============================================================================
// Render Order Tests
// ============================================================================

void TestAnnotationManager::testRenderAll_InsertionOrder()
{
    AnnotationManager manager;
    QVector<int> log;
    for (int id = 1; id <= 4; ++id) {
        manager.addAnnotation(committedTool(id, &log));
    }

    QImage image(10, 10, QImage::Format_ARGB32_Premultiplied);
    QPainter painter(&image);
    manager.renderAll(painter);

    QCOMPARE(log, QVector<int>({ 1, 2, 3, 4 }));
}

void TestAnnotationManager::testRenderAll_CurrentToolLastWhileDrawing()
{
    AnnotationManager manager;
    QVector<int> log;
    manager.addAnnotation(committedTool(1, &log));

    auto current = std::make_unique<RecordingTool>(99, &log);
    current->startDrawing(QPoint(0, 0));
    manager.setCurrentTool(std::move(current));

    // Added after the current tool started, still painted under it
    manager.addAnnotation(committedTool(2, &log));

    QImage image(10, 10, QImage::Format_ARGB32_Premultiplied);
    QPainter painter(&image);
    manager.renderAll(painter);

    QCOMPARE(log, QVector<int>({ 1, 2, 99 }));
}

void TestAnnotationManager::testRenderAll_FinishedCurrentToolNotRendered()
{
    AnnotationManager manager;
    QVector<int> log;

    auto current = std::make_unique<RecordingTool>(7, &log);
    current->startDrawing(QPoint(0, 0));
    current->finishDrawing(QPoint(1, 1));
    manager.setCurrentTool(std::move(current));

    QImage image(10, 10, QImage::Format_ARGB32_Premultiplied);
    QPainter painter(&image);
    manager.renderAll(painter);

    QVERIFY(log.isEmpty());
}

// ============================================================================
// Current Tool Tests
// ============================================================================

void TestAnnotationManager::testCommitCurrentTool_WhenFinished()
{
    AnnotationManager manager;
    QVector<int> log;

    auto tool = std::make_unique<RecordingTool>(5, &log);
    tool->startDrawing(QPoint(0, 0));
    manager.setCurrentTool(std::move(tool));
    manager.currentTool()->finishDrawing(QPoint(3, 3));

    QVERIFY(manager.commitCurrentTool());
    QCOMPARE(manager.annotationCount(), 1);
    QVERIFY(manager.currentTool() == nullptr);
    QVERIFY(manager.annotationAt(0)->isCommitted());
}

void TestAnnotationManager::testCommitCurrentTool_StillDrawing()
{
    AnnotationManager manager;
    QVERIFY(!manager.commitCurrentTool());

    auto tool = std::make_unique<LineTool>();
    tool->startDrawing(QPoint(0, 0));
    manager.setCurrentTool(std::move(tool));

    QVERIFY(!manager.commitCurrentTool());
    QCOMPARE(manager.annotationCount(), 0);
    QVERIFY(manager.currentTool() != nullptr);
}

void TestAnnotationManager::testTakeCurrentTool()
{
    AnnotationManager manager;
    auto tool = std::make_unique<LineTool>();
    AnnotationTool *raw = tool.get();
    manager.setCurrentTool(std::move(tool));

    std::unique_ptr<AnnotationTool> taken = manager.takeCurrentTool();
    QCOMPARE(taken.get(), raw);
    QVERIFY(manager.currentTool() == nullptr);
}

// ============================================================================
// Signal Tests
// ============================================================================

void TestAnnotationManager::testChangedSignal()
{
    AnnotationManager manager;
    QVector<int> log;
    QSignalSpy spy(&manager, &AnnotationManager::changed);

    manager.addAnnotation(committedTool(1, &log));
    QCOMPARE(spy.count(), 1);

    manager.setCurrentTool(std::make_unique<LineTool>());
    QCOMPARE(spy.count(), 2);

    manager.undo();
    QCOMPARE(spy.count(), 3);

    manager.clearAll();
    QCOMPARE(spy.count(), 4);
}

void TestAnnotationManager::testChangedSignal_TakeCurrentTool()
{
    AnnotationManager manager;
    manager.setCurrentTool(std::make_unique<LineTool>());

    QSignalSpy spy(&manager, &AnnotationManager::changed);
    std::unique_ptr<AnnotationTool> taken = manager.takeCurrentTool();
    QVERIFY(taken != nullptr);
    QCOMPARE(spy.count(), 1);

    // Nothing left to take
    QVERIFY(manager.takeCurrentTool() == nullptr);
    QCOMPARE(spy.count(), 1);
}

// ============================================================================
// Compositing Tests
// ============================================================================

void TestAnnotationManager::testRenderedCopy_LeavesBaseUntouched()
{
    AnnotationManager manager;

    DrawStyle style;
    style.filled = true;
    style.fillAlpha = 255;
    style.color = QColor(0, 0, 255);
    auto rect = std::make_unique<RectangleTool>(style);
    rect->startDrawing(QPoint(10, 10));
    rect->finishDrawing(QPoint(40, 40));
    manager.addAnnotation(std::move(rect));

    QImage base(50, 50, QImage::Format_RGB32);
    base.fill(Qt::white);
    const QImage original = base.copy();

    const QImage result = manager.renderedCopy(base);

    QCOMPARE(base, original);
    QCOMPARE(result.size(), base.size());
    QCOMPARE(result.format(), QImage::Format_ARGB32_Premultiplied);
    QCOMPARE(result.pixelColor(25, 25), QColor(0, 0, 255));
    QCOMPARE(result.pixelColor(2, 2), QColor(Qt::white));
}

void TestAnnotationManager::testRenderOnto_NullImage()
{
    AnnotationManager manager;
    QVector<int> log;
    manager.addAnnotation(committedTool(1, &log));

    QImage image;
    manager.renderOnto(image);

    QVERIFY(image.isNull());
    QVERIFY(log.isEmpty());
}

QTEST_MAIN(TestAnnotationManager)
#include "tst_AnnotationManager.moc"
