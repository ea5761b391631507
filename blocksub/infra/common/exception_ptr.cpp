// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "exception_ptr.hpp"

#include <boost/system/errc.hpp>
#include <boost/system/system_error.hpp>

namespace blocksub {

bool is_operation_cancelled_error(const std::exception_ptr& ex_ptr) {
    if (!ex_ptr) return false;
    try {
        std::rethrow_exception(ex_ptr);
    } catch (const boost::system::system_error& e) {
        return (e.code() == boost::system::errc::operation_canceled);
    } catch (...) {
        return false;
    }
}

std::string describe_exception(const std::exception_ptr& ex_ptr) {
    if (!ex_ptr) return "none";
    try {
        std::rethrow_exception(ex_ptr);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unexpected exception";
    }
}

}  // namespace blocksub
