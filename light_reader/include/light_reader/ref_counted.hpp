/*
 *    ref_counted.hpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef LIGHT_READER_REF_COUNTED_HPP
#define LIGHT_READER_REF_COUNTED_HPP

#include <cstdint>

namespace lr {

// Intrusive reference counting. Objects start with a count of one and
// delete themselves when Release() drops the last reference.
class RefCounted {
 public:
  virtual ~RefCounted() noexcept {};
  virtual auto AddRef() -> std::int64_t = 0;
  virtual auto Release() -> void = 0;
};

}  // namespace lr

#endif  // LIGHT_READER_REF_COUNTED_HPP
