/*
 *    shared_ptr.hpp:
 *
 *    Copyright (C) 2025-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef LIGHT_READER_SHARE_PTR_HPP
#define LIGHT_READER_SHARE_PTR_HPP

#include <utility>

#include "include/light_reader/ref_counted.hpp"

namespace lr {

template <typename T>
class SharedPtr {
 public:
  SharedPtr() : ptr_(nullptr) {}

  SharedPtr(T *ptr, bool add_ref) : ptr_(ptr) {
    if (add_ref && ptr_) {
      ptr_->AddRef();
    }
  }

  SharedPtr(const SharedPtr<T> &other) : ptr_(other.ptr_) {
    if (ptr_) {
      ptr_->AddRef();
    }
  }

  SharedPtr(SharedPtr<T> &&other) : ptr_(other.ptr_) { other.ptr_ = nullptr; }

  ~SharedPtr() {
    if (ptr_) {
      ptr_->Release();
    }
  }

  SharedPtr<T> &operator=(const SharedPtr<T> &other) {
    if (this != &other) {
      if (other.ptr_) {
        other.ptr_->AddRef();
      }
      if (ptr_) {
        ptr_->Release();
      }
      ptr_ = other.ptr_;
    }
    return *this;
  }

  SharedPtr<T> &operator=(SharedPtr<T> &&other) {
    if (this != &other) {
      if (ptr_) {
        ptr_->Release();
      }
      ptr_ = other.ptr_;
      other.ptr_ = nullptr;
    }
    return *this;
  }

  // Drops the held reference, if any.
  auto reset() -> void { *this = SharedPtr<T>(); }

  T *get() const { return ptr_; }
  T &operator*() const { return *ptr_; }
  T *operator->() const { return ptr_; }

  explicit operator bool() const { return ptr_ != nullptr; }

 private:
  T *ptr_;
};

template <typename T, typename... Args>
SharedPtr<T> MakeShared(Args &&...args) {
  return SharedPtr<T>(new T(std::forward<Args>(args)...), false);
}

}  // namespace lr

#endif  // LIGHT_READER_SHARE_PTR_HPP
