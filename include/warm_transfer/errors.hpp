#pragma once

#include <stdexcept>
#include <string>

namespace warm_transfer {

class WarmTransferError : public std::runtime_error {
public:
    explicit WarmTransferError(const std::string& message) : std::runtime_error(message) {}
};

// Destination rejected by the signaling provider (invalid number, trunk down).
class DialFailure : public WarmTransferError {
public:
    explicit DialFailure(const std::string& message) : WarmTransferError(message) {}
};

class Timeout : public WarmTransferError {
public:
    explicit Timeout(const std::string& message) : WarmTransferError(message) {}
};

class LegEndedUnexpectedly : public WarmTransferError {
public:
    explicit LegEndedUnexpectedly(const std::string& message) : WarmTransferError(message) {}
};

class ToolUnavailable : public WarmTransferError {
public:
    explicit ToolUnavailable(const std::string& message) : WarmTransferError(message) {}
};

class BriefingTimeout : public Timeout {
public:
    explicit BriefingTimeout(const std::string& message) : Timeout(message) {}
};

class SessionCancelled : public WarmTransferError {
public:
    explicit SessionCancelled(const std::string& message) : WarmTransferError(message) {}
};

class TelephonyError : public WarmTransferError {
public:
    explicit TelephonyError(const std::string& message) : WarmTransferError(message) {}
};

}
