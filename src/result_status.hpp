#pragma once

#include <optional>
#include <string>

enum class ResultStatus { Success, Error };

// Failure taxonomy carried by per-file results. NotFound is a normal
// outcome (no catalog coverage), not an error status.
enum class ErrorKind { None, IO, Parse, NotFound, Collision, Validation };

inline const char* to_string(ResultStatus status) {
  return status == ResultStatus::Success ? "success" : "error";
}

inline const char* to_string(ErrorKind kind) {
  switch(kind) {
    case ErrorKind::None: return "none";
    case ErrorKind::IO: return "io";
    case ErrorKind::Parse: return "parse";
    case ErrorKind::NotFound: return "not_found";
    case ErrorKind::Collision: return "collision";
    case ErrorKind::Validation: return "validation";
  }
  return "none";
}
