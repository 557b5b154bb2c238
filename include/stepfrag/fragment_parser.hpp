#pragma once

#include <cstdint>
#include <functional>
#include <vector>

namespace stepfrag {

using Bytes = std::vector<std::uint8_t>;

// Pull callback handed to a parser: returns up to `size` bytes at `offset`;
// a short result means end of data.
using ReadFn = std::function<Bytes(std::uint64_t offset, std::uint32_t size)>;

// Consumer that turns an exchange file into a compressed artifact. It may
// request ranges in any order. Failures are reported by throwing.
class FragmentParser {
 public:
  virtual ~FragmentParser() = default;

  [[nodiscard]] virtual Bytes Process(const ReadFn& read) = 0;
};

}  // namespace stepfrag
