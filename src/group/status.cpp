// CHAMA - Operation Status Implementation
// Copyright (c) 2024 CHAMA Developers
// MIT License

#include "chama/group/status.h"

namespace chama {
namespace group {

const char* StatusCodeToString(Status::Code code) {
    switch (code) {
        case Status::OK:              return "OK";
        case Status::UNAUTHORIZED:    return "Unauthorized";
        case Status::PRECONDITION:    return "Precondition";
        case Status::VALUE_MISMATCH:  return "ValueMismatch";
        case Status::CAPACITY:        return "Capacity";
        case Status::INTEGRITY:       return "Integrity";
        case Status::TRANSFER_FAILED: return "TransferFailed";
        case Status::REENTRANCY:      return "Reentrancy";
        default:                      return "Unknown";
    }
}

std::string Status::ToString() const {
    if (ok()) return "OK";
    return std::string(StatusCodeToString(code_)) + ": " + message_;
}

} // namespace group
} // namespace chama
