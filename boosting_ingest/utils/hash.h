/*
 * Copyright 2021 Google LLC.
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Stable hashing methods. Unlike absl::Hash, the values returned here do not
// depend on the process and can be compared across runs and machines.

#ifndef BOOSTING_INGEST_UTILS_HASH_H_
#define BOOSTING_INGEST_UTILS_HASH_H_

#include <cstdint>
#include <cstring>
#include <string>

#include "absl/strings/string_view.h"

#include "farmhash.h"
namespace farmhash_namespace = ::util;

namespace boosting_ingest {
namespace utils {
namespace hash {

inline uint64_t HashStringViewToUint64(const absl::string_view value) {
  return ::farmhash_namespace::Fingerprint64(value.data(), value.size());
}

// Accumulates values into a byte buffer with a fixed (little-endian)
// encoding, and fingerprints the result.
//
// Usage example:
//   FingerprintBuilder builder;
//   builder.AddInt32(5);
//   builder.AddFloat(1.5f);
//   const uint64_t h = builder.Fingerprint();
class FingerprintBuilder {
 public:
  void AddUint8(uint8_t value) { buffer_.push_back(static_cast<char>(value)); }

  void AddInt32(int32_t value) { AddLittleEndian(static_cast<uint32_t>(value)); }

  void AddInt64(int64_t value) { AddLittleEndian(static_cast<uint64_t>(value)); }

  void AddFloat(float value) {
    uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    AddLittleEndian(bits);
  }

  void AddDouble(double value) {
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    AddLittleEndian(bits);
  }

  uint64_t Fingerprint() const { return HashStringViewToUint64(buffer_); }

 private:
  template <typename T>
  void AddLittleEndian(T value) {
    for (size_t byte_idx = 0; byte_idx < sizeof(T); byte_idx++) {
      buffer_.push_back(static_cast<char>((value >> (8 * byte_idx)) & 0xFF));
    }
  }

  std::string buffer_;
};

}  // namespace hash
}  // namespace utils
}  // namespace boosting_ingest

#endif  // BOOSTING_INGEST_UTILS_HASH_H_
