#include "errors.h"

namespace livetalk {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                return "none";
        case ErrorKind::Busy:                return "busy";
        case ErrorKind::InvalidRequest:      return "invalid_request";
        case ErrorKind::EmptyTranscription:  return "empty_transcription";
        case ErrorKind::TranscriptionFailed: return "transcription_failed";
        case ErrorKind::BackendUnavailable:  return "backend_unavailable";
        case ErrorKind::BackendError:        return "backend_error";
        case ErrorKind::ProtocolError:       return "protocol_error";
        case ErrorKind::SynthesisFailed:     return "synthesis_failed";
        case ErrorKind::Cancelled:           return "cancelled";
        case ErrorKind::Timeout:             return "timeout";
        case ErrorKind::CompressionFailed:   return "compression_failed";
        case ErrorKind::StoreError:          return "store_error";
        case ErrorKind::ConfigError:         return "config_error";
    }
    return "unknown";
}

} // namespace livetalk
