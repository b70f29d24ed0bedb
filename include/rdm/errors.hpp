#pragma once

#include <stdexcept>
#include <string>

namespace rdm {

// Raised inside a transfer task; absorbed into Status::Error at the task boundary.
class TransferError : public std::runtime_error {
public:
    explicit TransferError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace rdm
