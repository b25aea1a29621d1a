#include "MassingTypes.h"

namespace massing {

const char* diagnosticKindName(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::InvalidInputRow: return "invalid_input_row";
        case DiagnosticKind::NoAcceptableProportion: return "no_acceptable_proportion";
        case DiagnosticKind::AreaOutsideTolerance: return "area_outside_tolerance";
        case DiagnosticKind::SmallRoom: return "small_room";
        default: return "unknown";
    }
}

} // namespace massing
