#pragma once

#include <QDebug>

namespace annot {

// Outcome of an edit operation. Everything except Ok is a local, non-fatal
// condition: the caller logs it and the interaction loop keeps going.
enum class Status {
    Ok = 0,
    InvalidGeometry,    // NaN, negative size, no image loaded
    DegenerateBox,      // below the minimum display size
    NoSuchBox,          // id not in the current set
    NoHoveredBox,       // keyboard command with nothing under the pointer
    Busy,               // drag in progress
    Ignored             // no AnnotationSet attached (inference pending)
};

const char* statusName(Status s);

inline bool isOk(Status s) { return s == Status::Ok; }

} // namespace annot

QDebug operator<<(QDebug dbg, annot::Status s);
