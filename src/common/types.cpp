#include "common/types.hpp"

const char* to_string(OperationKind kind) noexcept {
    switch (kind) {
        case OperationKind::kSafeRead:           return "safe_read";
        case OperationKind::kDestructiveWrite:   return "destructive_write";
        case OperationKind::kFileOperation:      return "file_operation";
        case OperationKind::kMultipleStatements: return "multiple_statements";
        case OperationKind::kEmpty:              return "empty";
        case OperationKind::kUnclassified:       return "unclassified";
        default:                                 return "unclassified";
    }
}

const char* to_string(DestructiveKind kind) noexcept {
    switch (kind) {
        case DestructiveKind::kDrop:     return "DROP";
        case DestructiveKind::kDelete:   return "DELETE";
        case DestructiveKind::kTruncate: return "TRUNCATE";
        case DestructiveKind::kAlter:    return "ALTER";
        case DestructiveKind::kInsert:   return "INSERT";
        case DestructiveKind::kUpdate:   return "UPDATE";
        case DestructiveKind::kCreate:   return "CREATE";
        case DestructiveKind::kGrant:    return "GRANT";
        case DestructiveKind::kRevoke:   return "REVOKE";
        default:                         return "UNKNOWN";
    }
}

const char* to_string(RejectCode code) noexcept {
    switch (code) {
        case RejectCode::kNone:                  return "none";
        case RejectCode::kEmptyInput:            return "empty_input";
        case RejectCode::kMultipleStatements:    return "multiple_statements";
        case RejectCode::kDestructiveOperation:  return "destructive_operation";
        case RejectCode::kFileOperation:         return "file_operation";
        case RejectCode::kUnclassifiedOperation: return "unclassified_operation";
        case RejectCode::kInternalError:         return "internal_error";
        case RejectCode::kAmbiguousSyntax:       return "ambiguous_syntax";
        default:                                 return "internal_error";
    }
}
