#pragma once
#include <cstdint>
#include <string>

namespace smux {

// Which source is active and how many of its bytes have been delivered.
struct SrcMeta {
  std::string name;
  std::int64_t byte_offset = 0;
};

inline bool operator==(const SrcMeta& a, const SrcMeta& b) {
  return a.name == b.name && a.byte_offset == b.byte_offset;
}
inline bool operator!=(const SrcMeta& a, const SrcMeta& b) { return !(a == b); }

}
