// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <mutex>
#include <utility>

namespace blocksub::concurrency {

//! Mutex guarded value for types std::atomic can't hold
template <typename T>
class AtomicValue {
  public:
    AtomicValue() = default;
    explicit AtomicValue(T value) : value_(std::move(value)) {}

    void set(T value) {
        std::scoped_lock lock(mutex_);
        value_ = std::move(value);
    }

    T get() const {
        std::scoped_lock lock(mutex_);
        return value_;
    }

  private:
    T value_{};
    mutable std::mutex mutex_;
};

}  // namespace blocksub::concurrency
