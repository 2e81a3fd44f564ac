#include "util/PipelineError.hpp"

namespace squarify {

const char* errorKindName(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::Decode: return "DecodeError";
    case ErrorKind::InvalidParameter: return "InvalidParameter";
    case ErrorKind::Encode: return "EncodeError";
    }
    return "UnknownError";
}

}
