#include "types.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:               return "none";
        case ErrorKind::NotConnected:       return "not_connected";
        case ErrorKind::ConnectionError:    return "connection_error";
        case ErrorKind::ConfigError:        return "config_error";
        case ErrorKind::CommandTimeout:     return "command_timeout";
        case ErrorKind::CommandFailed:      return "command_failed";
        case ErrorKind::PathInvalid:        return "path_invalid";
        case ErrorKind::SizeExceedsLimit:   return "size_exceeds_limit";
        case ErrorKind::PermissionInvalid:  return "permission_invalid";
        case ErrorKind::DestinationExists:  return "destination_exists";
        case ErrorKind::SourceNotFound:     return "source_not_found";
        case ErrorKind::TargetNotFound:     return "target_not_found";
        case ErrorKind::TransferIOError:    return "transfer_io_error";
        case ErrorKind::IndirectionFailed:  return "indirection_failed";
        case ErrorKind::HostAccessDisabled: return "host_access_disabled";
        case ErrorKind::Internal:           return "internal";
    }
    return "internal";
}

bool is_validation_error(ErrorKind kind) {
    return kind == ErrorKind::PathInvalid ||
           kind == ErrorKind::SizeExceedsLimit ||
           kind == ErrorKind::PermissionInvalid;
}

const char* container_state_name(ContainerState state) {
    switch (state) {
        case ContainerState::Running: return "running";
        case ContainerState::Stopped: return "stopped";
        case ContainerState::Unknown: return "unknown";
    }
    return "unknown";
}
