#pragma once

#include "annot_status.h"
#include "geometry.h"

#include <QRectF>
#include <QPointF>
#include <QVector>

namespace annot {

// Binary classification; the persisted class_id comes from a ClassIdMapping.
enum class ClassLabel { Bad = 0, Good = 1 };

inline ClassLabel toggled(ClassLabel c)
{
    return c == ClassLabel::Good ? ClassLabel::Bad : ClassLabel::Good;
}

using BoxId = int;
constexpr BoxId kNoBox = -1;

// One annotation. Geometry is normalized to the raw image and is the only
// stored copy; display rects are derived through a ViewTransform.
struct Box {
    BoxId      id    = kNoBox;
    ClassLabel label = ClassLabel::Good;
    double     cx = 0.0, cy = 0.0, w = 0.0, h = 0.0;

    // transient, never persisted
    bool hovered  = false;
    bool selected = false;

    QRectF rect() const { return QRectF(cx - w / 2.0, cy - h / 2.0, w, h); }
    void   setRect(const QRectF& r);
};

enum class ClampPolicy {
    Intersect,  // create / resize
    Translate   // move
};

// All boxes of the image on screen, in creation order.
class AnnotationSet
{
public:
    AnnotationSet() = default;

    // Display-space entry point used by the interaction engine.
    Status addBox(const QRectF& displayRect, ClassLabel label,
                  const ViewTransform& vt, double minSizePx,
                  BoxId* outId = nullptr);

    // Normalized entry point used by the codec. Returns kNoBox when the rect
    // is empty after clamping.
    BoxId  append(const QRectF& normalizedRect, ClassLabel label);

    Status removeBox(BoxId id);
    Status updateBoxRect(BoxId id, const QRectF& displayRect,
                         const ViewTransform& vt, ClampPolicy policy);
    Status toggleClass(BoxId id);
    void   clear();

    void   setHover(BoxId id);
    void   setSelected(BoxId id);
    BoxId  hovered()  const { return m_hovered; }
    BoxId  selected() const { return m_selected; }

    // Topmost box under a display point; the most recently created wins.
    BoxId  hitTest(const QPointF& displayPt, const ViewTransform& vt,
                   double tolerancePx = 0.0) const;
    // Recomputes hover from the pointer. Returns true if it changed.
    bool   updateHover(const QPointF& displayPt, const ViewTransform& vt,
                       double tolerancePx = 0.0);

    const Box*          find(BoxId id) const;
    std::optional<QRectF> displayRect(BoxId id, const ViewTransform& vt) const;
    const QVector<Box>& boxes() const { return m_boxes; }
    int                 size() const  { return m_boxes.size(); }
    bool                isEmpty() const { return m_boxes.isEmpty(); }

    bool isModified() const { return m_modified; }
    void markSaved()        { m_modified = false; }

private:
    int indexOf(BoxId id) const;

    QVector<Box> m_boxes;
    BoxId        m_nextId   = 0;
    BoxId        m_hovered  = kNoBox;
    BoxId        m_selected = kNoBox;
    bool         m_modified = false;
};

} // namespace annot
