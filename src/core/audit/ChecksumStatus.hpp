#pragma once

namespace fixity {

enum class ChecksumStatus { Ok, Invalid, Missing };

inline const char* to_string(ChecksumStatus s) {
  switch (s) {
    case ChecksumStatus::Ok:      return "ok";
    case ChecksumStatus::Invalid: return "invalid";
    case ChecksumStatus::Missing: return "missing";
  }
  return "unknown";
}

} // namespace fixity
