// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>

#include <blocksub/infra/common/log.hpp>

namespace blocksub::test_util {

//! Changes the log verbosity for the guard lifetime
class SetLogVerbosityGuard {
  public:
    explicit SetLogVerbosityGuard(log::Level new_level) : previous_level_(log::get_verbosity()) {
        log::set_verbosity(new_level);
    }
    ~SetLogVerbosityGuard() { log::set_verbosity(previous_level_); }

  private:
    log::Level previous_level_;
};

//! Redirects a stream into another one for the guard lifetime
class StreamSwap {
  public:
    StreamSwap(std::ostream& target, std::ostream& replacement)
        : buffer_(target.rdbuf()), stream_(target) { target.rdbuf(replacement.rdbuf()); }
    ~StreamSwap() { stream_.rdbuf(buffer_); }

  private:
    std::streambuf* buffer_;
    std::ostream& stream_;
};

}  // namespace blocksub::test_util
