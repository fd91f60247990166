/**
 * @file vocabulary.hpp
 * @brief Exception-free vocabulary types shared by all fsup modules.
 *
 * - expected<V, E>  : value-or-error return type (void specialization included)
 * - optional<T>     : nullable value without heap allocation
 * - FixedString<N>  : inline, bounded, null-terminated string
 * - NewType<T, Tag> : strong typedef preventing accidental id mixing
 *
 * Compatible with -fno-exceptions -fno-rtti.
 */

#ifndef FSUP_VOCABULARY_HPP_
#define FSUP_VOCABULARY_HPP_

#include "fsup/platform.hpp"

#include <cstdint>
#include <cstring>

#include <new>
#include <type_traits>
#include <utility>

namespace fsup {

// ============================================================================
// Shared error codes
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue,
};

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Construct through the success()/error() factories. Accessing value() on an
 * error (or get_error() on a success) is a programming error caught by
 * FSUP_ASSERT.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) { return expected(v); }
  static expected success(V&& v) { return expected(std::move(v)); }
  static expected error(E e) noexcept { return expected(ErrorTag{}, e); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(*other.ptr());
    } else {
      err_ = other.err_;
    }
  }

  expected(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(std::move(*other.ptr()));
    } else {
      err_ = other.err_;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_) V(*other.ptr());
      } else {
        err_ = other.err_;
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_) V(std::move(*other.ptr()));
      } else {
        err_ = other.err_;
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    FSUP_ASSERT(has_value_);
    return *ptr();
  }
  const V& value() const& noexcept {
    FSUP_ASSERT(has_value_);
    return *ptr();
  }

  E get_error() const noexcept {
    FSUP_ASSERT(!has_value_);
    return err_;
  }

  V value_or(const V& fallback) const { return has_value_ ? *ptr() : fallback; }

 private:
  struct ErrorTag {};

  explicit expected(const V& v) : has_value_(true) { ::new (&storage_) V(v); }
  explicit expected(V&& v) : has_value_(true) { ::new (&storage_) V(std::move(v)); }
  expected(ErrorTag, E e) noexcept : has_value_(false), err_(e) {}

  V* ptr() noexcept { return std::launder(reinterpret_cast<V*>(&storage_)); }
  const V* ptr() const noexcept { return std::launder(reinterpret_cast<const V*>(&storage_)); }

  void Destroy() noexcept {
    if (has_value_) {
      ptr()->~V();
    }
  }

  typename std::aligned_storage<sizeof(V), alignof(V)>::type storage_;
  bool has_value_;
  E err_{};
};

/** @brief expected<void, E>: success carries no payload. */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E e) noexcept { return expected(false, e); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    FSUP_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected(bool ok, E e) noexcept : has_value_(ok), err_(e) {}

  bool has_value_;
  E err_;
};

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
class optional final {
 public:
  optional() noexcept : has_value_(false) {}
  optional(const T& v) : has_value_(true) { ::new (&storage_) T(v); }  // NOLINT
  optional(T&& v) : has_value_(true) { ::new (&storage_) T(std::move(v)); }  // NOLINT

  optional(const optional& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) T(*other.ptr());
    }
  }

  optional(optional&& other) noexcept(std::is_nothrow_move_constructible<T>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) T(std::move(*other.ptr()));
    }
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (&storage_) T(*other.ptr());
        has_value_ = true;
      }
    }
    return *this;
  }

  optional& operator=(optional&& other) noexcept(std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (&storage_) T(std::move(*other.ptr()));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() noexcept {
    FSUP_ASSERT(has_value_);
    return *ptr();
  }
  const T& value() const noexcept {
    FSUP_ASSERT(has_value_);
    return *ptr();
  }

  T value_or(const T& fallback) const { return has_value_ ? *ptr() : fallback; }

  void reset() noexcept {
    if (has_value_) {
      ptr()->~T();
      has_value_ = false;
    }
  }

 private:
  T* ptr() noexcept { return std::launder(reinterpret_cast<T*>(&storage_)); }
  const T* ptr() const noexcept { return std::launder(reinterpret_cast<const T*>(&storage_)); }

  typename std::aligned_storage<sizeof(T), alignof(T)>::type storage_;
  bool has_value_;
};

// ============================================================================
// FixedString<Capacity>
// ============================================================================

/// Tag selecting the truncating FixedString constructor / assign overload.
struct TruncateToCapacity_t {};
static constexpr TruncateToCapacity_t TruncateToCapacity{};

/**
 * @brief Stack-allocated string with compile-time capacity.
 *
 * The literal constructor rejects oversized literals at compile time; use the
 * TruncateToCapacity overloads for runtime strings.
 */
template <uint32_t Capacity>
class FixedString final {
  static_assert(Capacity > 0U, "FixedString capacity must be > 0");

 public:
  FixedString() noexcept { buf_[0] = '\0'; }

  template <uint32_t N>
  FixedString(const char (&str)[N]) noexcept {  // NOLINT
    static_assert(N <= Capacity + 1U, "String literal exceeds FixedString capacity");
    std::memcpy(buf_, str, N);
    size_ = N - 1U;
  }

  FixedString(TruncateToCapacity_t, const char* str) noexcept { assign(TruncateToCapacity, str); }

  void assign(TruncateToCapacity_t, const char* str) noexcept {
    size_ = 0U;
    if (str != nullptr) {
      while (size_ < Capacity && str[size_] != '\0') {
        buf_[size_] = str[size_];
        ++size_;
      }
    }
    buf_[size_] = '\0';
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0U; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }

  void clear() noexcept {
    size_ = 0U;
    buf_[0] = '\0';
  }

  template <uint32_t M>
  bool operator==(const FixedString<M>& rhs) const noexcept {
    return size_ == rhs.size() && std::memcmp(buf_, rhs.c_str(), size_) == 0;
  }

  template <uint32_t M>
  bool operator!=(const FixedString<M>& rhs) const noexcept {
    return !(*this == rhs);
  }

  bool operator==(const char* rhs) const noexcept {
    return rhs != nullptr && std::strcmp(buf_, rhs) == 0;
  }

 private:
  char buf_[Capacity + 1U];
  uint32_t size_{0U};
};

// ============================================================================
// NewType<T, Tag>
// ============================================================================

/**
 * @brief Strong typedef: distinct Tag types make ids non-interchangeable.
 */
template <typename T, typename Tag>
class NewType final {
 public:
  constexpr explicit NewType(T v) noexcept : val_(v) {}

  constexpr T value() const noexcept { return val_; }

  constexpr bool operator==(NewType rhs) const noexcept { return val_ == rhs.val_; }
  constexpr bool operator!=(NewType rhs) const noexcept { return val_ != rhs.val_; }
  constexpr bool operator<(NewType rhs) const noexcept { return val_ < rhs.val_; }

 private:
  T val_;
};

}  // namespace fsup

#endif  // FSUP_VOCABULARY_HPP_
