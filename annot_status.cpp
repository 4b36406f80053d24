#include "annot_status.h"

namespace annot {

const char* statusName(Status s)
{
    switch (s) {
    case Status::Ok:              return "Ok";
    case Status::InvalidGeometry: return "InvalidGeometry";
    case Status::DegenerateBox:   return "DegenerateBox";
    case Status::NoSuchBox:       return "NoSuchBox";
    case Status::NoHoveredBox:    return "NoHoveredBox";
    case Status::Busy:            return "Busy";
    case Status::Ignored:         return "Ignored";
    }
    return "Unknown";
}

} // namespace annot

QDebug operator<<(QDebug dbg, annot::Status s)
{
    QDebugStateSaver saver(dbg);
    dbg.nospace() << annot::statusName(s);
    return dbg;
}
