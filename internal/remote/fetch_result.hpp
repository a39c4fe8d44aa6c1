#pragma once

#include <utility>
#include <variant>

#include "internal/model/remote_error.hpp"

namespace rdash::remote {

/*
  Value-or-RemoteError returned by every remote read.
*/
template <typename T>
class FetchResult {
 public:
  FetchResult(T value) : state_(std::in_place_index<0>, std::move(value)) {
  }

  FetchResult(model::RemoteError error) : state_(std::in_place_index<1>, std::move(error)) {
  }

  bool ok() const {
    return state_.index() == 0;
  }

  const T& value() const {
    return std::get<0>(state_);
  }

  T& value() {
    return std::get<0>(state_);
  }

  const model::RemoteError& error() const {
    return std::get<1>(state_);
  }

 private:
  std::variant<T, model::RemoteError> state_;
};

} // namespace rdash::remote
