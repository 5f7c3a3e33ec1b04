/*
 * Copyright (C) 2026 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <core/common/tools/string.hpp>

#include "exception.hpp"

namespace rootdev::common::utils {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

RootDevException::RootDevException(const aos::Error& err, const std::string& message)
    : Poco::Exception(message, err.Message(), err.Errno())
    , mError(err, message.c_str())
{
    aos::StaticString<aos::cMaxErrorStrLen> errStr;

    std::string finalMessage = message;

    if (errStr.Convert(err).IsNone()) {
        finalMessage += std::string(": ") + errStr.CStr();
    }

    Poco::Exception::message(finalMessage);
}

aos::Error ToAosError(const std::exception& e, aos::ErrorEnum err)
{
    if (const auto* rootDevExc = dynamic_cast<const RootDevException*>(&e)) {
        return rootDevExc->GetError();
    }

    if (const auto* pocoExc = dynamic_cast<const Poco::Exception*>(&e)) {
        return aos::Error {err, pocoExc->displayText().c_str()};
    }

    return aos::Error {err, e.what()};
}

} // namespace rootdev::common::utils
