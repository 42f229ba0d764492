/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace nska::keyed {

enum class ErrorKind {
    UnsupportedArchive,
    OutOfRange,
    MissingField,
    LengthMismatch,
    InvalidLength,
    UnsupportedClass,
    CyclicReference,
    Malformed,
};

std::string_view error_kind_name(ErrorKind kind);

// Raised for any structural violation; a decode either returns a complete
// tree or throws exactly one of these.
class DecodeError : public std::runtime_error {
   public:
    DecodeError(
        ErrorKind kind,
        std::string detail,
        std::optional<std::size_t> object_index = std::nullopt
    );

    ErrorKind kind() const { return _kind; }
    const std::string& detail() const { return _detail; }
    std::optional<std::size_t> object_index() const { return _object_index; }

   private:
    ErrorKind _kind;
    std::string _detail;
    std::optional<std::size_t> _object_index;
};

}  // namespace nska::keyed
