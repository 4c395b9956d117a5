/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace dntkit::dnt {

enum class ErrorCode {
    Io,
    UnknownTypeTag,
    BadSentinel,
    ContractViolation,
};

class DntError : public std::runtime_error {
   public:
    DntError(ErrorCode code, const std::string& what) : std::runtime_error(what), _code(code) {}

    ErrorCode code() const { return _code; }

   private:
    ErrorCode _code;
};

// Short read, seek past end, or a stream that refused the bytes.
class IoError : public DntError {
   public:
    explicit IoError(const std::string& what) : DntError(ErrorCode::Io, what) {}
};

class FormatError : public DntError {
   public:
    FormatError(ErrorCode code, const std::string& what) : DntError(code, what) {}
};

class UnknownTypeTagError : public FormatError {
   public:
    explicit UnknownTypeTagError(std::uint8_t tag)
        : FormatError(
              ErrorCode::UnknownTypeTag, "Invalid column type value: " + std::to_string(tag)
          ),
          _tag(tag) {}

    std::uint8_t tag() const { return _tag; }

   private:
    std::uint8_t _tag;
};

// The table handed to the encoder does not match its own header.
class ContractViolation : public DntError {
   public:
    explicit ContractViolation(const std::string& what)
        : DntError(ErrorCode::ContractViolation, what) {}
};

}  // namespace dntkit::dnt
