/*
 * Copyright (C) 2026 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ROOTDEV_CONFIG_CONFIG_HPP_
#define ROOTDEV_CONFIG_CONFIG_HPP_

#include <string>

#include <Poco/JSON/Object.h>

#include <core/common/tools/error.hpp>

namespace rootdev::config {

/***********************************************************************************************************************
 * Types
 **********************************************************************************************************************/

/*
 * Root device resolver configuration.
 */
struct Config {
    std::string mParamName;
    bool        mAutodetect {};
    std::string mArchitecture;
};

/***********************************************************************************************************************
 * Functions
 **********************************************************************************************************************/

/*
 * Parses configuration from JSON object. Missing keys get default values, architecture defaults to the host one.
 *
 * @param object JSON object.
 * @param[out] config configuration.
 * @return Error.
 */
aos::Error ParseConfig(const Poco::JSON::Object::Ptr& object, Config& config);

/*
 * Parses configuration from JSON file.
 *
 * @param filename JSON file name.
 * @return RetWithError<Config>.
 */
aos::RetWithError<Config> ParseConfig(const std::string& filename);

} // namespace rootdev::config

#endif
