#pragma once

#include <string>
#include <utility>

namespace chunkwire::core {

// Error types for transfer and storage operations
enum class TransferError {
    SUCCESS = 0,
    NOT_FOUND,
    OUT_OF_RANGE,
    INVALID_STATE,
    INVALID_ARGUMENT,
    STORE_FAILURE,
    METADATA_MISMATCH,
    CHANNEL_CLOSED,
    PROTOCOL_ERROR,
    FILE_READ_ERROR,
    FILE_WRITE_ERROR,
    CANCELLED
};

const char* to_string(TransferError error);

struct Result {
    TransferError error;
    std::string message;

    Result(TransferError err = TransferError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}

    bool success() const { return error == TransferError::SUCCESS; }
    operator bool() const { return success(); }
};

}
