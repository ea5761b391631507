// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>

#include <blocksub/infra/concurrency/task.hpp>

#include <blocksub/types/header.hpp>

namespace blocksub {

//! Sequence of pushed headers of one live subscription
class HeaderStream {
  public:
    virtual ~HeaderStream() = default;

    //! Next header, or nullptr once the stream has been closed (clean shutdown)
    //! \throws std::exception when the stream terminated abnormally
    virtual Task<HeaderPtr> next() = 0;

    //! Ends the stream cleanly, thread-safe and idempotent
    virtual void close() = 0;
};

//! Pull capability: the header at the tip of the node
class HeaderFetcher {
  public:
    virtual ~HeaderFetcher() = default;

    //! \throws std::exception on transport or decoding failure
    virtual Task<HeaderPtr> latest_header() = 0;
};

//! Push capability: new chain heads as they are announced by the node
class HeaderSubscriber {
  public:
    virtual ~HeaderSubscriber() = default;

    //! \throws std::exception if the subscription can't be established
    virtual Task<std::shared_ptr<HeaderStream>> subscribe_new_heads() = 0;
};

}  // namespace blocksub
