#include "AnnotationEditor.h"
#include "annotations/AnnotationManager.h"
#include "annotations/AnnotationToolFactory.h"
#include "annotations/TextTool.h"
#include "settings/AnnotationSettingsManager.h"

#include <QCloseEvent>
#include <QDebug>
#include <QInputDialog>
#include <QKeyEvent>
#include <QMouseEvent>
#include <QPainter>

AnnotationEditor::AnnotationEditor(const QImage& image, QWidget* parent)
    : QWidget(parent)
    , m_manager(new AnnotationManager(this))
    , m_image(image)
{
    setWindowFlags(Qt::Window | Qt::WindowStaysOnTopHint);
    setAttribute(Qt::WA_DeleteOnClose);
    setFocusPolicy(Qt::StrongFocus);
    setCursor(Qt::CrossCursor);

    const auto& settings = AnnotationSettingsManager::instance();
    m_toolType = settings.loadToolType();
    m_color = settings.loadColor();
    m_thickness = settings.loadWidth();
    m_filled = settings.loadFilled();

    m_textProvider = [](QWidget* parent) {
        bool ok = false;
        const QString text = QInputDialog::getText(parent, tr("Add Text"), tr("Text:"),
                                                   QLineEdit::Normal, QString(), &ok);
        return ok ? text : QString();
    };

    connect(m_manager, &AnnotationManager::changed, this, QOverload<>::of(&QWidget::update));

    setFixedSize(sizeHint());
    updateTitle();
}

AnnotationEditor::~AnnotationEditor() = default;

QSize AnnotationEditor::sizeHint() const
{
    if (m_image.isNull()) {
        return QSize(320, 240);
    }
    return (QSizeF(m_image.size()) / m_image.devicePixelRatio()).toSize();
}

QImage AnnotationEditor::resultImage() const
{
    return m_manager->renderedCopy(m_image);
}

void AnnotationEditor::setToolType(AnnotationToolType type)
{
    if (m_toolType == type) return;

    // Switching tools abandons an unfinished gesture
    m_manager->setCurrentTool(nullptr);
    m_toolType = type;
    AnnotationSettingsManager::instance().saveToolType(type);
    updateTitle();
    emit toolChanged(type);
}

void AnnotationEditor::setColor(const QColor& color)
{
    if (!color.isValid()) return;

    m_color = color;
    AnnotationSettingsManager::instance().saveColor(color);
}

void AnnotationEditor::setThickness(int thickness)
{
    m_thickness = qBound(AnnotationSettingsManager::kMinWidth, thickness,
                         AnnotationSettingsManager::kMaxWidth);
    AnnotationSettingsManager::instance().saveWidth(m_thickness);
    updateTitle();
}

void AnnotationEditor::setFilled(bool filled)
{
    m_filled = filled;
    AnnotationSettingsManager::instance().saveFilled(filled);
    updateTitle();
}

void AnnotationEditor::setTextProvider(TextProvider provider)
{
    m_textProvider = std::move(provider);
}

DrawStyle AnnotationEditor::currentStyle() const
{
    DrawStyle style = AnnotationToolFactory::defaultStyle(m_toolType);
    if (m_toolType != AnnotationToolType::Highlighter) {
        style.color = m_color;
        style.filled = m_filled;
    }
    style.thickness = m_thickness;
    return style;
}

void AnnotationEditor::updateTitle()
{
    setWindowTitle(tr("Annotate - %1, width %2%3")
                       .arg(toolTypeName(m_toolType))
                       .arg(m_thickness)
                       .arg(m_filled ? tr(", filled") : QString()));
}

void AnnotationEditor::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    painter.drawImage(rect(), m_image);
    m_manager->renderAll(painter);
}

void AnnotationEditor::placeText(const QPoint& pos)
{
    const QString text = m_textProvider ? m_textProvider(this) : QString();
    if (text.isEmpty()) {
        qDebug() << "AnnotationEditor: Text annotation skipped";
        return;
    }

    auto tool = std::make_unique<TextTool>(currentStyle());
    tool->setText(text);
    tool->startDrawing(pos);
    tool->finishDrawing(pos);
    m_manager->addAnnotation(std::move(tool));
}

void AnnotationEditor::mousePressEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton) return;

    const QPoint pos = event->position().toPoint();
    if (m_toolType == AnnotationToolType::Text) {
        placeText(pos);
        return;
    }

    auto tool = AnnotationToolFactory::create(m_toolType, currentStyle());
    if (!tool) return;

    tool->startDrawing(pos);
    m_manager->setCurrentTool(std::move(tool));
}

void AnnotationEditor::mouseMoveEvent(QMouseEvent* event)
{
    AnnotationTool* tool = m_manager->currentTool();
    if (tool && tool->isDrawing()) {
        tool->updateDrawing(event->position().toPoint());
        update();
    }
}

void AnnotationEditor::mouseReleaseEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton) return;

    AnnotationTool* tool = m_manager->currentTool();
    if (!tool || !tool->isDrawing()) return;

    tool->finishDrawing(event->position().toPoint());
    m_manager->commitCurrentTool();
}

void AnnotationEditor::keyPressEvent(QKeyEvent* event)
{
    const int key = event->key();

    if (key == Qt::Key_Escape) {
        qDebug() << "AnnotationEditor: Cancelled via Escape";
        cancel();
    }
    else if (key == Qt::Key_Return || key == Qt::Key_Enter || event->matches(QKeySequence::Save)) {
        accept();
    }
    else if (event->matches(QKeySequence::Undo)) {
        m_manager->undo();
    }
    else if (key == Qt::Key_Delete) {
        m_manager->clearAll();
    }
    else if (key >= Qt::Key_1 && key <= Qt::Key_7 && !(event->modifiers() & Qt::ControlModifier)) {
        const auto types = AnnotationToolFactory::allTypes();
        const int index = key - Qt::Key_1;
        if (index < types.size()) {
            setToolType(types.at(index));
        }
    }
    else if (key == Qt::Key_F) {
        setFilled(!m_filled);
    }
    else if (key == Qt::Key_Plus || key == Qt::Key_Equal) {
        setThickness(m_thickness + 1);
    }
    else if (key == Qt::Key_Minus) {
        setThickness(m_thickness - 1);
    }
    else {
        QWidget::keyPressEvent(event);
    }
}

void AnnotationEditor::accept()
{
    if (m_outcomeReported) return;
    m_outcomeReported = true;

    const QImage result = resultImage();
    qDebug() << "AnnotationEditor: Accepted with" << m_manager->annotationCount() << "annotations";
    emit annotationAccepted(result);
    close();
}

void AnnotationEditor::cancel()
{
    if (m_outcomeReported) return;
    m_outcomeReported = true;

    emit annotationCancelled();
    close();
}

void AnnotationEditor::closeEvent(QCloseEvent* event)
{
    if (!m_outcomeReported) {
        m_outcomeReported = true;
        emit annotationCancelled();
    }
    QWidget::closeEvent(event);
}
