#include "interaction_engine.h"

#include <QDebug>

namespace annot {

InteractionEngine::InteractionEngine(QObject* parent)
    : QObject(parent)
{
}

void InteractionEngine::attach(AnnotationSet* set)
{
    cancelInteraction();
    m_set = set;
    emit annotationsChanged();
}

void InteractionEngine::detach()
{
    cancelInteraction();
    m_set = nullptr;
    emit annotationsChanged();
}

// ---------------------------
// View
// ---------------------------
void InteractionEngine::setImageSize(const QSizeF& size)
{
    cancelInteraction();
    m_view.imageSize = size;
    emit viewChanged();
}

void InteractionEngine::setViewportOrigin(const QPointF& origin)
{
    if (m_view.viewportOrigin == origin) return;
    m_view.viewportOrigin = origin;
    emit viewChanged();
}

Status InteractionEngine::setZoom(int zoom)
{
    if (!isSupportedZoom(zoom)) return Status::InvalidGeometry;
    if (!isIdle())              return Status::Busy;
    if (m_view.zoomFactor == zoom) return Status::Ok;

    // normalized boxes stay as they are; only the derived display rects move
    m_view.zoomFactor = zoom;
    if (m_set) m_set->setHover(kNoBox);
    emit zoomChanged(zoom);
    emit viewChanged();
    return Status::Ok;
}

void InteractionEngine::setResizeHandlesEnabled(bool on)
{
    if (m_handlesEnabled == on) return;
    m_handlesEnabled = on;
    emit resizeHandlesChanged(on);
    emit viewChanged();
}

std::optional<QRectF> InteractionEngine::rubberBand() const
{
    if (const auto* d = std::get_if<DrawingState>(&m_mode))
        return rectFromCorners(d->anchor, d->current);
    return std::nullopt;
}

// ---------------------------
// Hit helpers
// ---------------------------
std::optional<InteractionEngine::HandleHit> InteractionEngine::hitHandle(const QPointF& pos) const
{
    // handles exist only on the hovered box, the one the canvas draws them on
    if (!m_set || !m_handlesEnabled) return std::nullopt;
    const BoxId id = m_set->hovered();
    if (id == kNoBox) return std::nullopt;

    const auto d = m_set->displayRect(id, m_view);
    if (!d) return std::nullopt;
    const auto handles = cornerHandleRects(*d, m_opts.handleSizePx);
    for (int k = 0; k < 4; ++k) {
        if (pointInRect(pos, handles[k]))
            return HandleHit{id, static_cast<Corner>(k)};
    }
    return std::nullopt;
}

void InteractionEngine::refreshHover(const QPointF& pos)
{
    if (!m_set) return;
    // half of each handle lies outside the box; keep hover while on one
    if (hitHandle(pos)) return;
    if (m_set->updateHover(pos, m_view, m_opts.hoverTolerancePx))
        emit hoverChanged(m_set->hovered());
}

// =========================
// Pointer events
// =========================
Status InteractionEngine::pointerDown(const QPointF& pos)
{
    if (!m_set) return Status::Ignored;
    if (!m_view.isValid()) return Status::InvalidGeometry;

    // a release we never saw; drop the old gesture
    if (!isIdle()) cancelInteraction();

    // 1) corner handles first, topmost box first
    if (const auto h = hitHandle(pos)) {
        const auto r = m_set->displayRect(h->box, m_view);
        if (!r) return Status::InvalidGeometry;
        m_mode = ResizingState{h->box, h->corner, cornerPoint(*r, oppositeCorner(h->corner))};
        m_set->setSelected(h->box);
        emit viewChanged();
        return Status::Ok;
    }

    // 2) box body
    const BoxId hit = m_set->hitTest(pos, m_view, m_opts.hoverTolerancePx);
    if (hit != kNoBox) {
        const auto r = m_set->displayRect(hit, m_view);
        if (!r) return Status::InvalidGeometry;
        m_mode = MovingState{hit, pos, *r};
        m_set->setSelected(hit);
        emit viewChanged();
        return Status::Ok;
    }

    // 3) empty canvas: start a new box
    m_set->setSelected(kNoBox);
    m_mode = DrawingState{pos, pos};
    emit viewChanged();
    return Status::Ok;
}

Status InteractionEngine::pointerMove(const QPointF& pos)
{
    if (!m_set) return Status::Ignored;

    if (auto* d = std::get_if<DrawingState>(&m_mode)) {
        d->current = pos;
        emit viewChanged();
        return Status::Ok;
    }

    if (const auto* mv = std::get_if<MovingState>(&m_mode)) {
        const QRectF r = mv->startRect.translated(pos - mv->press);
        const Status st = m_set->updateBoxRect(mv->box, r, m_view, ClampPolicy::Translate);
        if (st == Status::NoSuchBox) {
            cancelInteraction();
            return st;
        }
        if (isOk(st)) emit annotationsChanged();
        return st;
    }

    if (const auto* rs = std::get_if<ResizingState>(&m_mode)) {
        const QRectF r = resizedRect(rs->pinned, pos, m_view.imageDisplayRect(), m_opts.minBoxSizePx);
        const Status st = m_set->updateBoxRect(rs->box, r, m_view, ClampPolicy::Intersect);
        if (st == Status::NoSuchBox) {
            cancelInteraction();
            return st;
        }
        if (isOk(st)) emit annotationsChanged();
        return st;
    }

    // Idle: hover follows the pointer
    refreshHover(pos);
    return Status::Ok;
}

Status InteractionEngine::pointerUp(const QPointF& pos)
{
    if (!m_set) {
        m_mode = IdleState{};
        return Status::Ignored;
    }

    Status st = Status::Ok;
    if (const auto* d = std::get_if<DrawingState>(&m_mode)) {
        BoxId id = kNoBox;
        st = m_set->addBox(rectFromCorners(d->anchor, pos), m_defaultClass,
                           m_view, m_opts.minBoxSizePx, &id);
        if (isOk(st)) {
            emit annotationsChanged();
        } else {
            qDebug() << "[Engine] new box discarded:" << st;
        }
    }

    m_mode = IdleState{};
    refreshHover(pos);
    emit viewChanged();
    return st;
}

void InteractionEngine::cancelInteraction()
{
    if (isIdle()) return;
    m_mode = IdleState{};
    emit viewChanged();
}

// =========================
// Keyboard commands
// =========================
Status InteractionEngine::deleteHovered()
{
    if (!m_set)     return Status::Ignored;
    if (!isIdle())  return Status::Busy;

    const BoxId id = m_set->hovered();
    if (id == kNoBox) return Status::NoHoveredBox;

    const Status st = m_set->removeBox(id);
    if (isOk(st)) {
        emit hoverChanged(kNoBox);
        emit annotationsChanged();
    }
    return st;
}

Status InteractionEngine::deleteSelected()
{
    if (!m_set)     return Status::Ignored;
    if (!isIdle())  return Status::Busy;

    const BoxId id = m_set->selected();
    if (id == kNoBox) return Status::NoSuchBox;

    const bool wasHovered = (m_set->hovered() == id);
    const Status st = m_set->removeBox(id);
    if (isOk(st)) {
        if (wasHovered) emit hoverChanged(kNoBox);
        emit annotationsChanged();
    }
    return st;
}

Status InteractionEngine::toggleClassOfHovered()
{
    if (!m_set)     return Status::Ignored;
    if (!isIdle())  return Status::Busy;

    const BoxId id = m_set->hovered();
    if (id == kNoBox) return Status::NoHoveredBox;

    const Status st = m_set->toggleClass(id);
    if (isOk(st)) emit annotationsChanged();
    return st;
}

Status InteractionEngine::toggleResizeHandles()
{
    // only gates the hit test at pointer-down; a resize in progress finishes
    setResizeHandlesEnabled(!m_handlesEnabled);
    return Status::Ok;
}

Status InteractionEngine::toggleZoom()
{
    return setZoom(nextZoomLevel(m_view.zoomFactor));
}

Status InteractionEngine::requestRefresh()
{
    if (!isIdle()) return Status::Busy;
    emit refreshRequested();
    return Status::Ok;
}

Status InteractionEngine::clearAll()
{
    if (!m_set)    return Status::Ignored;
    if (!isIdle()) return Status::Busy;
    if (m_set->isEmpty()) return Status::Ok;

    m_set->clear();
    emit hoverChanged(kNoBox);
    emit annotationsChanged();
    return Status::Ok;
}

} // namespace annot
