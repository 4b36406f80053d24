#include "annotation_codec.h"

#include <QDebug>
#include <QRegularExpression>
#include <QStringList>

#include <algorithm>
#include <cmath>
#include <limits>

namespace annot {

QString ParseWarning::toString() const
{
    return QStringLiteral("line %1: %2 (\"%3\")").arg(lineNumber).arg(reason, line);
}

static inline QRectF rectFromCenter(double cx, double cy, double w, double h)
{
    return QRectF(cx - w / 2.0, cy - h / 2.0, w, h);
}

// class ids are written as integers, but "1.0" from other tools is accepted
static bool parseClassId(const QString& s, int* out)
{
    bool ok = false;
    int v = s.toInt(&ok);
    if (!ok) {
        const double d = s.toDouble(&ok);
        if (!ok || !std::isfinite(d) || std::floor(d) != d) return false;
        if (d < 0.0 || d > double(std::numeric_limits<int>::max())) return false;
        v = static_cast<int>(d);
    }
    if (v < 0) return false;
    *out = v;
    return true;
}

// =========================
// serialize
// =========================
QString serialize(const AnnotationSet& set, const ClassIdMapping& mapping, int precision)
{
    const int prec = std::max(precision, kMinPrecision);

    QString out;
    for (const Box& b : set.boxes()) {
        out += QStringLiteral("%1 %2 %3 %4 %5\n")
                   .arg(mapping.idFor(b.label))
                   .arg(b.cx, 0, 'f', prec)
                   .arg(b.cy, 0, 'f', prec)
                   .arg(b.w,  0, 'f', prec)
                   .arg(b.h,  0, 'f', prec);
    }
    return out;
}

// =========================
// deserialize
// =========================
AnnotationSet deserialize(const QString& text, const ClassIdMapping& mapping,
                          QVector<ParseWarning>* warnings)
{
    AnnotationSet set;
    static const QRegularExpression ws(QStringLiteral("\\s+"));

    auto warn = [warnings](int n, const QString& line, const QString& why) {
        qWarning() << "[Codec] skipped line" << n << ":" << why;
        if (warnings) warnings->push_back({n, line, why});
    };

    const QStringList lines = text.split(QLatin1Char('\n'));
    for (int i = 0; i < lines.size(); ++i) {
        const QString line = lines[i].trimmed();
        const int     n    = i + 1;
        if (line.isEmpty()) continue;

        const QStringList t = line.split(ws, Qt::SkipEmptyParts);
        if (t.size() != 5) {
            warn(n, line, QStringLiteral("expected 5 fields, got %1").arg(t.size()));
            continue;
        }

        int classId = 0;
        if (!parseClassId(t[0], &classId)) {
            warn(n, line, QStringLiteral("class id is not a non-negative integer"));
            continue;
        }

        double v[4];
        bool numeric = true;
        for (int k = 0; k < 4; ++k) {
            bool ok = false;
            v[k] = t[k + 1].toDouble(&ok);
            if (!ok || !std::isfinite(v[k])) { numeric = false; break; }
        }
        if (!numeric) {
            warn(n, line, QStringLiteral("non-numeric coordinate"));
            continue;
        }

        const double cx = v[0], cy = v[1], w = v[2], h = v[3];
        if (cx < 0.0 || cx > 1.0 || cy < 0.0 || cy > 1.0) {
            warn(n, line, QStringLiteral("center outside [0,1]"));
            continue;
        }
        if (w <= 0.0 || w > 1.0 || h <= 0.0 || h > 1.0) {
            warn(n, line, QStringLiteral("size outside (0,1]"));
            continue;
        }

        if (set.append(rectFromCenter(cx, cy, w, h), mapping.labelFor(classId)) == kNoBox)
            warn(n, line, QStringLiteral("empty box after clamping"));
    }

    set.markSaved();
    return set;
}

// =========================
// fromPredictions
// =========================
AnnotationSet fromPredictions(const QVector<Prediction>& predictions,
                              double confidenceThreshold,
                              const ClassIdMapping& modelMapping)
{
    AnnotationSet set;
    int dropped = 0;

    for (const Prediction& p : predictions) {
        if (!(p.confidence >= confidenceThreshold)) continue;
        if (!(p.w > 0.0) || !(p.h > 0.0)) { ++dropped; continue; }

        if (set.append(rectFromCenter(p.cx, p.cy, p.w, p.h),
                       modelMapping.labelFor(p.classId)) == kNoBox)
            ++dropped;
    }

    if (dropped > 0)
        qDebug() << "[Codec] fromPredictions: dropped" << dropped << "invalid predictions";

    set.markSaved();
    return set;
}

} // namespace annot
