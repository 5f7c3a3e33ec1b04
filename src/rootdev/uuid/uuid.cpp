/*
 * Copyright (C) 2026 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cctype>

#include <Poco/UUID.h>

#include "uuid.hpp"

namespace rootdev::uuid {

namespace {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

constexpr size_t cHyphenPositions[] = {8, 13, 18, 23};

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

bool IsHyphenPosition(size_t pos)
{
    for (const auto hyphenPos : cHyphenPositions) {
        if (pos == hyphenPos) {
            return true;
        }
    }

    return false;
}

bool HasCanonicalLayout(const std::string& str)
{
    if (str.size() != cUUIDStrLen) {
        return false;
    }

    for (size_t i = 0; i < str.size(); ++i) {
        if (IsHyphenPosition(i)) {
            if (str[i] != '-') {
                return false;
            }

            continue;
        }

        if (!std::isxdigit(static_cast<unsigned char>(str[i]))) {
            return false;
        }
    }

    return true;
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

std::string StripQuotes(const std::string& str)
{
    if (str.size() >= 2 && str.front() == '"' && str.back() == '"') {
        return str.substr(1, str.size() - 2);
    }

    return str;
}

aos::RetWithError<UUID> StringToUUID(const std::string& str)
{
    UUID uuid {};

    if (!HasCanonicalLayout(str)) {
        return {uuid, aos::Error(aos::ErrorEnum::eInvalidArgument, "malformed UUID")};
    }

    Poco::UUID pocoUUID;

    if (!pocoUUID.tryParse(str)) {
        return {uuid, aos::Error(aos::ErrorEnum::eInvalidArgument, "malformed UUID")};
    }

    pocoUUID.copyTo(reinterpret_cast<char*>(uuid.data()));

    return uuid;
}

std::string UUIDToString(const UUID& uuid)
{
    Poco::UUID pocoUUID;

    pocoUUID.copyFrom(reinterpret_cast<const char*>(uuid.data()));

    return pocoUUID.toString();
}

} // namespace rootdev::uuid
