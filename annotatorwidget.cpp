#include "annotatorwidget.h"

#include <QDebug>
#include <QFontMetrics>
#include <QImageReader>
#include <QKeyEvent>
#include <QMouseEvent>
#include <QPaintEvent>
#include <QPainter>
#include <QPen>
#include <QResizeEvent>

#include <algorithm>
#include <cmath>

using annot::Box;
using annot::ClassLabel;
using annot::Corner;

namespace {

QColor classColor(ClassLabel c, bool hovered)
{
    if (c == ClassLabel::Good) return hovered ? QColor(0, 255, 0) : QColor(0, 200, 0);
    return hovered ? QColor(255, 0, 0) : QColor(200, 0, 0);
}

Qt::CursorShape cursorForCorner(Corner c)
{
    switch (c) {
    case Corner::TopLeft:
    case Corner::BottomRight: return Qt::SizeFDiagCursor;
    case Corner::TopRight:
    case Corner::BottomLeft:  return Qt::SizeBDiagCursor;
    }
    return Qt::ArrowCursor;
}

} // namespace

AnnotatorWidget::AnnotatorWidget(annot::InteractionEngine* engine, QWidget* parent)
    : QWidget(parent)
    , m_engine(engine)
{
    Q_ASSERT(m_engine);
    setMouseTracking(true);                 // hover without a pressed button
    setFocusPolicy(Qt::StrongFocus);
    setAttribute(Qt::WA_OpaquePaintEvent);

    connect(m_engine, &annot::InteractionEngine::annotationsChanged, this, [this]{ update(); });
    connect(m_engine, &annot::InteractionEngine::hoverChanged,       this, [this]{ update(); });
    connect(m_engine, &annot::InteractionEngine::viewChanged,        this, [this]{ update(); });
    connect(m_engine, &annot::InteractionEngine::zoomChanged,        this, &AnnotatorWidget::relayout);
}

// =========================
// Image
// =========================
bool AnnotatorWidget::loadImage(const QString& path)
{
    QImageReader reader(path);
    reader.setAutoTransform(false);     // label coordinates refer to the stored pixels
    QImage img = reader.read();
    if (img.isNull()) {
        qWarning() << "[Annotator] image load failed:" << path << reader.errorString();
        emit log(tr("Image load failed: %1 (%2)").arg(path, reader.errorString()));
        clearImage();
        return false;
    }

    // the engine learns the size from the session; layout follows in relayout()
    m_image     = std::move(img);
    m_imagePath = path;
    update();
    return true;
}

void AnnotatorWidget::clearImage()
{
    m_image     = QImage();
    m_imagePath.clear();
    setMinimumSize(0, 0);
    updateGeometry();
    update();
}

void AnnotatorWidget::setClassNames(const QString& good, const QString& bad)
{
    m_goodName = good;
    m_badName  = bad;
    update();
}

void AnnotatorWidget::setBusy(bool busy)
{
    if (m_busy == busy) return;
    m_busy = busy;
    setCursor(busy ? Qt::BusyCursor : Qt::ArrowCursor);
    update();
}

QSize AnnotatorWidget::sizeHint() const
{
    const QSizeF d = m_engine->view().displaySize();
    if (d.isEmpty()) return QSize(640, 480);
    return QSize(int(std::ceil(d.width())), int(std::ceil(d.height())));
}

QSize AnnotatorWidget::minimumSizeHint() const
{
    return m_image.isNull() ? QSize(200, 150) : sizeHint();
}

// =========================
// Layout
// =========================
void AnnotatorWidget::relayout()
{
    // the scroll area sizes us to at least the zoomed image
    const QSize s = m_image.isNull() ? QSize(0, 0) : sizeHint();
    setMinimumSize(s);
    updateGeometry();
    updateViewportOrigin();
    update();
}

void AnnotatorWidget::updateViewportOrigin()
{
    const QSizeF d = m_engine->view().displaySize();
    const double x = std::max(0.0, std::floor((width()  - d.width())  / 2.0));
    const double y = std::max(0.0, std::floor((height() - d.height()) / 2.0));
    m_engine->setViewportOrigin(QPointF(x, y));
}

void AnnotatorWidget::resizeEvent(QResizeEvent* e)
{
    QWidget::resizeEvent(e);
    updateViewportOrigin();
}

// ---------------------------
// Cursor
// ---------------------------
void AnnotatorWidget::setCursorForPos(const QPointF& pos)
{
    if (m_busy) return;

    const annot::AnnotationSet* set = m_engine->annotations();
    if (!set || !m_engine->resizeHandlesEnabled() || set->hovered() == annot::kNoBox) {
        setCursor(set && set->hovered() != annot::kNoBox ? Qt::OpenHandCursor : Qt::CrossCursor);
        return;
    }

    const auto r = set->displayRect(set->hovered(), m_engine->view());
    if (r) {
        const auto handles = annot::cornerHandleRects(*r, m_engine->options().handleSizePx);
        for (int i = 0; i < int(handles.size()); ++i) {
            if (annot::pointInRect(pos, handles[i])) {
                setCursor(cursorForCorner(static_cast<Corner>(i)));
                return;
            }
        }
    }
    setCursor(Qt::OpenHandCursor);
}

// =========================
// Events
// =========================
void AnnotatorWidget::mousePressEvent(QMouseEvent* e)
{
    if (e->button() != Qt::LeftButton || m_image.isNull()) {
        QWidget::mousePressEvent(e);
        return;
    }
    setFocus(Qt::MouseFocusReason);

    const annot::Status st = m_engine->pointerDown(e->position());
    if (st == annot::Status::Ignored) {
        e->ignore();
        return;
    }

    if (std::holds_alternative<annot::MovingState>(m_engine->mode()))
        setCursor(Qt::ClosedHandCursor);
    else if (const auto* r = std::get_if<annot::ResizingState>(&m_engine->mode()))
        setCursor(cursorForCorner(r->corner));

    e->accept();
    update();
}

void AnnotatorWidget::mouseMoveEvent(QMouseEvent* e)
{
    if (m_image.isNull()) {
        QWidget::mouseMoveEvent(e);
        return;
    }

    m_engine->pointerMove(e->position());
    if (m_engine->isIdle())
        setCursorForPos(e->position());

    e->accept();
    update();
}

void AnnotatorWidget::mouseReleaseEvent(QMouseEvent* e)
{
    if (e->button() != Qt::LeftButton || m_image.isNull()) {
        QWidget::mouseReleaseEvent(e);
        return;
    }

    const bool wasDrawing = std::holds_alternative<annot::DrawingState>(m_engine->mode());
    const annot::Status st = m_engine->pointerUp(e->position());
    if (wasDrawing && st == annot::Status::DegenerateBox)
        qDebug() << "[Annotator] box too small, dropped";
    else if (st == annot::Status::InvalidGeometry)
        emit log(tr("Edit rejected: %1").arg(annot::statusName(st)));

    setCursorForPos(e->position());
    e->accept();
    update();
}

void AnnotatorWidget::keyPressEvent(QKeyEvent* e)
{
    if (e->key() == Qt::Key_Escape && !m_engine->isIdle()) {
        m_engine->cancelInteraction();
        update();
        return;
    }
    QWidget::keyPressEvent(e);
}

void AnnotatorWidget::leaveEvent(QEvent* e)
{
    // keep hover while a drag is in progress
    if (m_engine->isIdle() && m_engine->annotations())
        m_engine->annotations()->setHover(annot::kNoBox);
    update();
    QWidget::leaveEvent(e);
}

// =========================
// Painting
// =========================
void AnnotatorWidget::paintEvent(QPaintEvent*)
{
    QPainter p(this);
    p.fillRect(rect(), QColor(20, 20, 20));

    if (m_image.isNull()) {
        p.setPen(QColor(160, 160, 160));
        p.drawText(rect(), Qt::AlignCenter, tr("No image loaded"));
        return;
    }

    const annot::ViewTransform& vt = m_engine->view();
    const int zoom = vt.zoomFactor;

    // nearest neighbour so 2x shows the real pixels
    p.setRenderHint(QPainter::SmoothPixmapTransform, false);
    p.drawImage(vt.imageDisplayRect(), m_image);

    if (m_busy) {
        p.fillRect(vt.imageDisplayRect(), QColor(0, 0, 0, 120));
        p.setPen(Qt::white);
        p.drawText(vt.imageDisplayRect(), Qt::AlignCenter, tr("Running inference..."));
        return;
    }

    const annot::AnnotationSet* set = m_engine->annotations();
    if (set) {
        p.setRenderHint(QPainter::Antialiasing, false);
        QFontMetrics fm(p.font());

        for (const Box& b : set->boxes()) {
            const auto r = annot::toDisplay(b.rect(), vt);
            if (!r) continue;

            const QColor c = classColor(b.label, b.hovered);
            const int penW = b.hovered ? std::max(4, 4 * zoom) : std::max(2, 2 * zoom);

            if (b.hovered) {
                QColor fill = c;
                fill.setAlpha(50);
                p.fillRect(*r, fill);
            }
            p.setPen(QPen(c, penW));
            p.setBrush(Qt::NoBrush);
            p.drawRect(*r);

            if (b.selected) {
                p.setPen(QPen(Qt::yellow, 1.0, Qt::DashLine));
                p.drawRect(r->adjusted(-penW, -penW, penW, penW));
            }

            // class tag above the box, sized to the name
            const QString name = b.label == ClassLabel::Good ? m_goodName : m_badName;
            const int w = fm.horizontalAdvance(name) + 8;
            const QRectF tag(r->topLeft() + QPointF(0, -18), QSizeF(w, 18));
            p.fillRect(tag, QColor(0, 0, 0, 180));
            p.setPen(Qt::white);
            p.drawText(tag.adjusted(3, 0, -3, 0), Qt::AlignVCenter | Qt::AlignLeft, name);

            if (b.hovered && m_engine->resizeHandlesEnabled()) {
                p.setPen(QPen(Qt::black, 1));
                p.setBrush(Qt::white);
                for (const QRectF& h : annot::cornerHandleRects(*r, m_engine->options().handleSizePx))
                    p.drawRect(h);
                p.setBrush(Qt::NoBrush);
            }
        }
    }

    if (const auto band = m_engine->rubberBand()) {
        p.setPen(QPen(Qt::yellow, std::max(2, 2 * zoom)));
        p.setBrush(Qt::NoBrush);
        p.drawRect(*band);
    }
}
