// CHAMA - Operation Status
// Copyright (c) 2024 CHAMA Developers
// MIT License
//
// Result of every mutating engine and registry operation. A non-OK status
// means the operation was rejected and left no trace.

#ifndef CHAMA_GROUP_STATUS_H
#define CHAMA_GROUP_STATUS_H

#include <string>

namespace chama {
namespace group {

class Status {
public:
    enum Code {
        OK = 0,
        UNAUTHORIZED = 1,     // Caller lacks the required role
        PRECONDITION = 2,     // Group, period, window or vote state disallows it
        VALUE_MISMATCH = 3,   // Attached amount differs from the required one
        CAPACITY = 4,         // Group full, queue misconfigured, creator limit
        INTEGRITY = 5,        // Double execution, double payout, unknown target
        TRANSFER_FAILED = 6,  // Value transfer collaborator refused
        REENTRANCY = 7,       // Nested call into an engine mid-operation
    };

    Status() : code_(OK) {}
    Status(Code code, const std::string& msg) : code_(code), message_(msg) {}

    static Status Ok() { return Status(); }
    static Status Unauthorized(const std::string& msg) { return Status(UNAUTHORIZED, msg); }
    static Status Precondition(const std::string& msg) { return Status(PRECONDITION, msg); }
    static Status ValueMismatch(const std::string& msg) { return Status(VALUE_MISMATCH, msg); }
    static Status Capacity(const std::string& msg) { return Status(CAPACITY, msg); }
    static Status Integrity(const std::string& msg) { return Status(INTEGRITY, msg); }
    static Status TransferFailed(const std::string& msg) { return Status(TRANSFER_FAILED, msg); }
    static Status Reentrancy(const std::string& msg) { return Status(REENTRANCY, msg); }

    bool ok() const { return code_ == OK; }
    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    std::string ToString() const;

private:
    Code code_;
    std::string message_;
};

const char* StatusCodeToString(Status::Code code);

} // namespace group
} // namespace chama

#endif // CHAMA_GROUP_STATUS_H
