#include "box_model.h"

namespace annot {

void Box::setRect(const QRectF& r)
{
    const QRectF n = r.normalized();
    cx = n.center().x();
    cy = n.center().y();
    w  = n.width();
    h  = n.height();
}

int AnnotationSet::indexOf(BoxId id) const
{
    if (id == kNoBox) return -1;
    for (int i = 0; i < m_boxes.size(); ++i)
        if (m_boxes[i].id == id) return i;
    return -1;
}

const Box* AnnotationSet::find(BoxId id) const
{
    const int i = indexOf(id);
    return i >= 0 ? &m_boxes[i] : nullptr;
}

std::optional<QRectF> AnnotationSet::displayRect(BoxId id, const ViewTransform& vt) const
{
    const Box* b = find(id);
    if (!b) return std::nullopt;
    return toDisplay(b->rect(), vt);
}

// =========================
// Mutations
// =========================
Status AnnotationSet::addBox(const QRectF& displayRect, ClassLabel label,
                             const ViewTransform& vt, double minSizePx,
                             BoxId* outId)
{
    if (outId) *outId = kNoBox;

    const auto n = toNormalized(displayRect, vt);
    if (!n) return Status::InvalidGeometry;

    const QRectF clamped = clampToUnit(*n);
    if (clamped.isEmpty()) return Status::DegenerateBox;

    // size floor is checked after clamping, in display pixels
    const auto d = toDisplay(clamped, vt);
    if (!d) return Status::InvalidGeometry;
    if (d->width() < minSizePx || d->height() < minSizePx)
        return Status::DegenerateBox;

    Box b;
    b.id    = m_nextId++;
    b.label = label;
    b.setRect(clamped);
    m_boxes.push_back(b);
    m_modified = true;

    if (outId) *outId = b.id;
    return Status::Ok;
}

BoxId AnnotationSet::append(const QRectF& normalizedRect, ClassLabel label)
{
    if (!isFiniteRect(normalizedRect)) return kNoBox;
    const QRectF clamped = clampToUnit(normalizedRect);
    if (clamped.isEmpty()) return kNoBox;

    Box b;
    b.id    = m_nextId++;
    b.label = label;
    b.setRect(clamped);
    m_boxes.push_back(b);
    return b.id;
}

Status AnnotationSet::removeBox(BoxId id)
{
    const int i = indexOf(id);
    if (i < 0) return Status::NoSuchBox;

    m_boxes.removeAt(i);
    if (m_hovered == id)  m_hovered  = kNoBox;
    if (m_selected == id) m_selected = kNoBox;
    m_modified = true;
    return Status::Ok;
}

Status AnnotationSet::updateBoxRect(BoxId id, const QRectF& displayRect,
                                   const ViewTransform& vt, ClampPolicy policy)
{
    const int i = indexOf(id);
    if (i < 0) return Status::NoSuchBox;

    const auto n = toNormalized(displayRect, vt);
    if (!n) return Status::InvalidGeometry;

    const QRectF clamped = (policy == ClampPolicy::Translate)
                               ? clampInsideUnit(*n)
                               : clampToUnit(*n);
    if (clamped.isEmpty()) return Status::DegenerateBox;

    m_boxes[i].setRect(clamped);
    m_modified = true;
    return Status::Ok;
}

Status AnnotationSet::toggleClass(BoxId id)
{
    const int i = indexOf(id);
    if (i < 0) return Status::NoSuchBox;

    m_boxes[i].label = toggled(m_boxes[i].label);
    m_modified = true;
    return Status::Ok;
}

void AnnotationSet::clear()
{
    if (!m_boxes.isEmpty()) m_modified = true;
    m_boxes.clear();
    m_hovered  = kNoBox;
    m_selected = kNoBox;
}

// =========================
// Hover / selection
// =========================
void AnnotationSet::setHover(BoxId id)
{
    m_hovered = (indexOf(id) >= 0) ? id : kNoBox;
    for (Box& b : m_boxes)
        b.hovered = (b.id == m_hovered);
}

void AnnotationSet::setSelected(BoxId id)
{
    m_selected = (indexOf(id) >= 0) ? id : kNoBox;
    for (Box& b : m_boxes)
        b.selected = (b.id == m_selected);
}

BoxId AnnotationSet::hitTest(const QPointF& displayPt, const ViewTransform& vt,
                             double tolerancePx) const
{
    // last added is drawn on top
    for (int i = m_boxes.size() - 1; i >= 0; --i) {
        const auto d = toDisplay(m_boxes[i].rect(), vt);
        if (d && pointInRect(displayPt, *d, tolerancePx))
            return m_boxes[i].id;
    }
    return kNoBox;
}

bool AnnotationSet::updateHover(const QPointF& displayPt, const ViewTransform& vt,
                                double tolerancePx)
{
    const BoxId before = m_hovered;
    setHover(hitTest(displayPt, vt, tolerancePx));
    return before != m_hovered;
}

} // namespace annot
