#pragma once
#include <stdexcept>
#include <string>

namespace squarify {

enum class ErrorKind
{
    Decode,
    InvalidParameter,
    Encode,
};

// "DecodeError", "InvalidParameter", "EncodeError"
const char* errorKindName(ErrorKind kind);

// Terminal failure of one pipeline invocation. Nothing partial survives it.
class PipelineError : public std::runtime_error
{
public:
    PipelineError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

}
