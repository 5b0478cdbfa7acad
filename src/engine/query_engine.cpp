//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// engine/query_engine.cpp
//===----------------------------------------------------------------------===//

#include "engine/query_engine.hpp"

namespace sqlbridge {

const char* StatementShapeToString(StatementShape shape) {
    switch (shape) {
        case StatementShape::ANY:         return "ANY";
        case StatementShape::SELECT_ONLY: return "SELECT_ONLY";
        case StatementShape::UPDATE_ONLY: return "UPDATE_ONLY";
    }
    return "UNKNOWN";
}

} // namespace sqlbridge
