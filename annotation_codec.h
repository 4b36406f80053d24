#pragma once

#include "box_model.h"

#include <QString>
#include <QVector>

namespace annot {

// Explicit two-entry table between ClassLabel and an integer class id.
// Ids other than goodId read back as Bad.
struct ClassIdMapping {
    int goodId = 1;
    int badId  = 0;

    ClassLabel labelFor(int classId) const
    {
        return classId == goodId ? ClassLabel::Good : ClassLabel::Bad;
    }
    int idFor(ClassLabel c) const
    {
        return c == ClassLabel::Good ? goodId : badId;
    }
};

// One detection from the model, normalized to the raw image.
struct Prediction {
    int    classId    = 0;
    double cx = 0.0, cy = 0.0, w = 0.0, h = 0.0;
    double confidence = 0.0;
};

// MalformedAnnotationLine: the line is skipped, the rest of the file loads.
struct ParseWarning {
    int     lineNumber = 0;     // 1-based
    QString line;
    QString reason;

    QString toString() const;
};

constexpr int kDefaultPrecision = 6;
constexpr int kMinPrecision     = 4;

// "class_id cx cy w h\n" per box, in set order.
QString serialize(const AnnotationSet& set, const ClassIdMapping& mapping,
                  int precision = kDefaultPrecision);

AnnotationSet deserialize(const QString& text, const ClassIdMapping& mapping,
                          QVector<ParseWarning>* warnings = nullptr);

// Keeps predictions with confidence >= threshold.
AnnotationSet fromPredictions(const QVector<Prediction>& predictions,
                              double confidenceThreshold,
                              const ClassIdMapping& modelMapping);

} // namespace annot
