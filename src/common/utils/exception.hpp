/*
 * Copyright (C) 2026 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ROOTDEV_COMMON_UTILS_EXCEPTION_HPP_
#define ROOTDEV_COMMON_UTILS_EXCEPTION_HPP_

#include <string>

#include <Poco/Exception.h>

#include <core/common/tools/error.hpp>

/**
 * Throws root device exception with wrapped error and message.
 */
#define ROOTDEV_ERROR_THROW(err, message)                                                                              \
    throw rootdev::common::utils::RootDevException(AOS_ERROR_WRAP(aos::Error(err)), message)

/**
 * Throws root device exception if error is set.
 */
#define ROOTDEV_ERROR_CHECK_AND_THROW(err, message)                                                                    \
    if (!aos::Error(err).IsNone()) {                                                                                   \
        ROOTDEV_ERROR_THROW(err, message);                                                                             \
    }

namespace rootdev::common::utils {

/**
 * Root device exception.
 */
class RootDevException : public Poco::Exception {
public:
    /**
     * Creates root device exception instance.
     *
     * @param err error.
     * @param message message.
     */
    RootDevException(const aos::Error& err, const std::string& message);

    /**
     * Returns error.
     *
     * @return aos::Error.
     */
    aos::Error GetError() const { return mError; }

    /**
     * Returns a static string describing the exception.
     *
     * @return const char*
     */
    const char* name() const noexcept override { return "Root device exception"; }

private:
    aos::Error mError;
};

/**
 * Converts exception to error.
 *
 * @param e exception.
 * @param err error.
 *
 * @return aos::Error.
 */
aos::Error ToAosError(const std::exception& e, aos::ErrorEnum err = aos::ErrorEnum::eFailed);

} // namespace rootdev::common::utils

#endif
