// CHIEFTALLY - External Call Results
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License

#include "chieftally/eth/result.h"

namespace chieftally {
namespace eth {

const char* ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Network: return "NetworkError";
        case ErrorKind::Decode: return "DecodeError";
        case ErrorKind::Range: return "RangeError";
        case ErrorKind::InterfaceMismatch: return "InterfaceMismatch";
    }
    return "UnknownError";
}

} // namespace eth
} // namespace chieftally
