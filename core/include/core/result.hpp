#pragma once
/**
 * @file result.hpp
 * @brief Error taxonomy and value-or-error result type
 *
 * Every fallible WordCard operation returns a CardResult. Fatal and
 * recoverable conditions are distinguished by CardErrorCode; the batch
 * driver decides what to skip and what to abort on.
 */

#include <new>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace WordCard {

/// Error categories
enum class CardErrorCode {
  InvalidConfiguration, ///< Unknown enum value or bad setting (fatal)
  NoBackgroundImages,   ///< Image pool is empty (fatal)
  UnreadableImage,      ///< A background file failed to decode (recovered)
  RenderFailure,        ///< A word could not be laid out or drawn (recovered)
  InvalidGeometry,      ///< Degenerate panel or text box (per word)
  IoFailure             ///< File could not be read or written
};

[[nodiscard]] constexpr std::string_view
error_code_name(CardErrorCode code) noexcept {
  switch (code) {
  case CardErrorCode::InvalidConfiguration:
    return "InvalidConfiguration";
  case CardErrorCode::NoBackgroundImages:
    return "NoBackgroundImages";
  case CardErrorCode::UnreadableImage:
    return "UnreadableImage";
  case CardErrorCode::RenderFailure:
    return "RenderFailure";
  case CardErrorCode::InvalidGeometry:
    return "InvalidGeometry";
  case CardErrorCode::IoFailure:
    return "IoFailure";
  }
  return "Unknown";
}

/// Error value carried by CardResult
struct CardError {
  std::string message;
  CardErrorCode code = CardErrorCode::RenderFailure;

  CardError() = default;
  CardError(CardErrorCode code_, std::string message_)
      : message(std::move(message_)), code(code_) {}

  /// "<CodeName>: <message>"
  [[nodiscard]] std::string describe() const {
    return std::string(error_code_name(code)) + ": " + message;
  }
};

/// Value-or-error result for WordCard operations
template <typename T> class CardResult {
public:
  // Success constructor
  CardResult(T value) : value_(std::move(value)), has_value_(true) {}

  // Error constructor
  CardResult(CardError error) : error_(std::move(error)), has_value_(false) {}

  CardResult(CardResult &&other) noexcept : has_value_(other.has_value_) {
    if (has_value_) {
      new (&value_) T(std::move(other.value_));
    } else {
      new (&error_) CardError(std::move(other.error_));
    }
  }

  CardResult &operator=(CardResult &&other) noexcept {
    if (this != &other) {
      destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        new (&value_) T(std::move(other.value_));
      } else {
        new (&error_) CardError(std::move(other.error_));
      }
    }
    return *this;
  }

  ~CardResult() { destroy(); }

  CardResult(const CardResult &) = delete;
  CardResult &operator=(const CardResult &) = delete;

  bool has_value() const { return has_value_; }
  explicit operator bool() const { return has_value_; }

  T &value() { return value_; }
  const T &value() const { return value_; }
  T &operator*() { return value(); }
  const T &operator*() const { return value(); }
  T *operator->() { return &value_; }
  const T *operator->() const { return &value_; }

  CardError &error() { return error_; }
  const CardError &error() const { return error_; }

private:
  void destroy() {
    if (has_value_) {
      value_.~T();
    } else {
      error_.~CardError();
    }
  }

  union {
    T value_;
    CardError error_;
  };
  bool has_value_;
};

/// Success-or-error result for side-effecting steps
template <> class CardResult<void> {
public:
  CardResult() = default;
  CardResult(CardError error) : error_(std::move(error)) {}

  bool has_value() const { return !error_.has_value(); }
  explicit operator bool() const { return !error_.has_value(); }

  CardError &error() { return *error_; }
  const CardError &error() const { return *error_; }

private:
  std::optional<CardError> error_;
};

/// Build an error result in one expression
[[nodiscard]] inline CardError make_error(CardErrorCode code,
                                          std::string message) {
  return CardError{code, std::move(message)};
}

} // namespace WordCard
