#include "ragvix/common/result.hpp"

namespace ragvix::common {

std::string_view error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "Ok";
  case ErrorCode::InvalidConfiguration:
    return "InvalidConfiguration";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::DimensionMismatch:
    return "DimensionMismatch";
  case ErrorCode::EmptyBatch:
    return "EmptyBatch";
  case ErrorCode::EmbeddingError:
    return "EmbeddingError";
  case ErrorCode::ModelUnavailable:
    return "ModelUnavailable";
  case ErrorCode::CorruptIndex:
    return "CorruptIndex";
  case ErrorCode::IndexUnavailable:
    return "IndexUnavailable";
  case ErrorCode::IoError:
    return "IoError";
  }
  return "Unknown";
}

std::string Status::describe() const {
  if (ok()) {
    return "Ok";
  }
  return std::string(error_code_name(code_)) + ": " + error_;
}

} // namespace ragvix::common
