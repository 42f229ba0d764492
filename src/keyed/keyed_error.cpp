/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "keyed/keyed_error.h"

namespace nska::keyed {

std::string_view error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnsupportedArchive:
            return "UnsupportedArchive";
        case ErrorKind::OutOfRange:
            return "OutOfRange";
        case ErrorKind::MissingField:
            return "MissingField";
        case ErrorKind::LengthMismatch:
            return "LengthMismatch";
        case ErrorKind::InvalidLength:
            return "InvalidLength";
        case ErrorKind::UnsupportedClass:
            return "UnsupportedClass";
        case ErrorKind::CyclicReference:
            return "CyclicReference";
        case ErrorKind::Malformed:
            return "Malformed";
    }
    return "Unknown";
}

static std::string format_message(
    ErrorKind kind,
    const std::string& detail,
    const std::optional<std::size_t>& object_index
) {
    std::string msg(error_kind_name(kind));
    msg += ": ";
    msg += detail;
    if (object_index.has_value()) {
        msg += " (object #";
        msg += std::to_string(*object_index);
        msg += ")";
    }
    return msg;
}

DecodeError::DecodeError(
    ErrorKind kind,
    std::string detail,
    std::optional<std::size_t> object_index
)
    : std::runtime_error(format_message(kind, detail, object_index)),
      _kind(kind),
      _detail(std::move(detail)),
      _object_index(object_index) {}

}  // namespace nska::keyed
