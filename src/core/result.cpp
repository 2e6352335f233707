#include "chunkwire/core/result.hpp"

namespace chunkwire::core {

const char* to_string(TransferError error) {
    switch (error) {
        case TransferError::SUCCESS:           return "success";
        case TransferError::NOT_FOUND:         return "not found";
        case TransferError::OUT_OF_RANGE:      return "out of range";
        case TransferError::INVALID_STATE:     return "invalid state";
        case TransferError::INVALID_ARGUMENT:  return "invalid argument";
        case TransferError::STORE_FAILURE:     return "store failure";
        case TransferError::METADATA_MISMATCH: return "metadata mismatch";
        case TransferError::CHANNEL_CLOSED:    return "channel closed";
        case TransferError::PROTOCOL_ERROR:    return "protocol error";
        case TransferError::FILE_READ_ERROR:   return "file read error";
        case TransferError::FILE_WRITE_ERROR:  return "file write error";
        case TransferError::CANCELLED:         return "cancelled";
    }
    return "unknown";
}

}
