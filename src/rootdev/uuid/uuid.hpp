/*
 * Copyright (C) 2026 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ROOTDEV_UUID_UUID_HPP_
#define ROOTDEV_UUID_UUID_HPP_

#include <array>
#include <cstdint>
#include <string>

#include <core/common/tools/error.hpp>

namespace rootdev::uuid {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

/**
 * UUID size in bytes.
 */
constexpr auto cUUIDSize = 16;

/**
 * Canonical UUID text length: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx.
 */
constexpr auto cUUIDStrLen = 36;

/***********************************************************************************************************************
 * Types
 **********************************************************************************************************************/

/**
 * UUID value. Bytes are kept in text order, no endianness swapping is done.
 */
using UUID = std::array<uint8_t, cUUIDSize>;

/***********************************************************************************************************************
 * Functions
 **********************************************************************************************************************/

/**
 * Removes one pair of surrounding double quotes if present.
 *
 * @param str source string.
 * @return std::string.
 */
std::string StripQuotes(const std::string& str);

/**
 * Parses UUID in canonical form. Hex digits are case-insensitive, hyphens must be at fixed positions.
 *
 * @param str UUID text.
 * @return RetWithError<UUID>.
 */
aos::RetWithError<UUID> StringToUUID(const std::string& str);

/**
 * Renders UUID in canonical lowercase form.
 *
 * @param uuid UUID.
 * @return std::string.
 */
std::string UUIDToString(const UUID& uuid);

} // namespace rootdev::uuid

#endif
