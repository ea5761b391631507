// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <exception>
#include <string>

namespace blocksub {

//! True if ex_ptr holds a boost::system::system_error with operation_canceled
bool is_operation_cancelled_error(const std::exception_ptr& ex_ptr);

//! what() of the held exception, for logging
std::string describe_exception(const std::exception_ptr& ex_ptr);

}  // namespace blocksub
