#include "errors.hpp"

namespace asn2ip {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConnectionError: return "connection_error";
        case ErrorCode::ProtocolError:   return "protocol_error";
        case ErrorCode::NotFound:        return "not_found";
        case ErrorCode::StorageNotFound: return "storage_not_found";
        case ErrorCode::StorageError:    return "storage_error";
    }
    return "unknown";
}

} // namespace asn2ip
