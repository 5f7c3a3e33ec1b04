/*
 * Copyright (C) 2026 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <charconv>
#include <cstring>
#include <map>

#include <core/common/tools/logger.hpp>

#include <rootdev/arch/arch.hpp>

#include "parser.hpp"

namespace rootdev::parser {

namespace {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

constexpr auto cFSUUIDPrefix        = "UUID=";
constexpr auto cFSUUIDPathPrefix    = "/dev/disk/by-uuid/";
constexpr auto cFSLabelPrefix       = "LABEL=";
constexpr auto cFSLabelPathPrefix   = "/dev/disk/by-label/";
constexpr auto cGPTUUIDPrefix       = "PARTUUID=";
constexpr auto cGPTUUIDPathPrefix   = "/dev/disk/by-partuuid/";
constexpr auto cGPTLabelPrefix      = "PARTLABEL=";
constexpr auto cGPTLabelPathPrefix  = "/dev/disk/by-partlabel/";
constexpr auto cDevPrefix           = "/dev/";
constexpr auto cPartitionOffsetMark = "/PARTNROFF=";

// https://uapi-group.org/specifications/specs/discoverable_partitions_specification/
const std::map<std::string, std::string> cAutodiscoveryGPTTypes = {
    {arch::cArchAMD64, "4f68bce3-e8cd-4db1-96e7-fbcaf984b709"},
    {arch::cArch386, "44479540-f297-41b2-9af7-d131d5f0458a"},
    {arch::cArchARM, "69dad710-2ce4-4e3c-b16c-21a1d49abed3"},
    {arch::cArchARM64, "b921b045-1df0-41c3-af44-4c6f280d3fae"},
};

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

bool TrimPrefix(const std::string& value, const std::string& prefix, std::string& rest)
{
    if (value.rfind(prefix, 0) != 0) {
        return false;
    }

    rest = value.substr(prefix.size());

    return true;
}

std::string ParamError(const std::string& paramName, const std::string& message, const std::string& value)
{
    return "unable to parse " + paramName + "= " + message + " '" + value + "'";
}

aos::RetWithError<uuid::UUID> ParseParamUUID(
    const std::string& paramName, const std::string& value, const std::string& uuidStr)
{
    auto [uuid, err] = uuid::StringToUUID(uuid::StripQuotes(uuidStr));
    if (!err.IsNone()) {
        return {uuid,
            aos::Error(aos::ErrorEnum::eInvalidArgument, ParamError(paramName, "UUID parameter", value).c_str())};
    }

    return uuid;
}

aos::RetWithError<int> ParsePartitionOffset(
    const std::string& paramName, const std::string& value, const std::string& offsetStr)
{
    int offset = 0;

    const auto begin  = offsetStr.data();
    const auto end    = offsetStr.data() + offsetStr.size();
    const auto result = std::from_chars(begin, end, offset);

    if (offsetStr.empty() || offsetStr.front() == '-' || result.ec != std::errc() || result.ptr != end) {
        return {0,
            aos::Error(aos::ErrorEnum::eOutOfRange, ParamError(paramName, "PARTNROFF= value", value).c_str())};
    }

    return offset;
}

aos::RetWithError<DeviceReference> ParseGPTUUID(
    const std::string& paramName, const std::string& value, const std::string& uuidStr)
{
    const auto markPos = uuidStr.find(cPartitionOffsetMark);

    if (markPos == std::string::npos) {
        auto [uuid, err] = ParseParamUUID(paramName, value, uuidStr);
        if (!err.IsNone()) {
            return {{}, err};
        }

        return DeviceReference {ByGPTUUID {uuid}};
    }

    auto [offset, err] = ParsePartitionOffset(paramName, value, uuidStr.substr(markPos + strlen(cPartitionOffsetMark)));
    if (!err.IsNone()) {
        return {{}, err};
    }

    auto [uuid, errUUID] = ParseParamUUID(paramName, value, uuidStr.substr(0, markPos));
    if (!errUUID.IsNone()) {
        return {{}, errUUID};
    }

    return DeviceReference {ByGPTUUIDWithOffset {uuid, offset}};
}

aos::RetWithError<DeviceReference> Autodiscover(
    const std::string& paramName, bool autodetect, const std::string& architecture)
{
    const auto missingErr
        = aos::Error(aos::ErrorEnum::eNotFound, (paramName + "= boot option is not specified").c_str());

    if (!autodetect) {
        return {{}, missingErr};
    }

    auto [gptType, err] = GetAutodiscoveryGPTType(architecture);
    if (!err.IsNone()) {
        return {{}, missingErr};
    }

    LOG_DBG() << "Boot option is not specified, use GPT partition autodiscovery"
              << aos::Log::Field("param", paramName.c_str())
              << aos::Log::Field("type", uuid::UUIDToString(gptType).c_str());

    return DeviceReference {ByGPTType {gptType}};
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

aos::RetWithError<uuid::UUID> GetAutodiscoveryGPTType(const std::string& architecture)
{
    auto it = cAutodiscoveryGPTTypes.find(architecture);
    if (it == cAutodiscoveryGPTTypes.end()) {
        return {{}, aos::Error(aos::ErrorEnum::eNotFound, "no autodiscovery partition type for architecture")};
    }

    return uuid::StringToUUID(it->second);
}

aos::RetWithError<DeviceReference> ParseDeviceRef(
    const std::string& paramName, const std::string& value, bool autodetect, const std::string& architecture)
{
    if (value.empty()) {
        return Autodiscover(paramName, autodetect, architecture);
    }

    std::string rest;

    if (TrimPrefix(value, cFSUUIDPrefix, rest) || TrimPrefix(value, cFSUUIDPathPrefix, rest)) {
        auto [uuid, err] = ParseParamUUID(paramName, value, rest);
        if (!err.IsNone()) {
            return {{}, err};
        }

        return DeviceReference {ByFSUUID {uuid}};
    }

    if (TrimPrefix(value, cFSLabelPrefix, rest) || TrimPrefix(value, cFSLabelPathPrefix, rest)) {
        return DeviceReference {ByFSLabel {rest}};
    }

    if (TrimPrefix(value, cGPTUUIDPrefix, rest)) {
        return ParseGPTUUID(paramName, value, rest);
    }

    if (TrimPrefix(value, cGPTUUIDPathPrefix, rest)) {
        auto [uuid, err] = ParseParamUUID(paramName, value, rest);
        if (!err.IsNone()) {
            return {{}, err};
        }

        return DeviceReference {ByGPTUUID {uuid}};
    }

    if (TrimPrefix(value, cGPTLabelPrefix, rest) || TrimPrefix(value, cGPTLabelPathPrefix, rest)) {
        return DeviceReference {ByGPTLabel {rest}};
    }

    if (TrimPrefix(value, cDevPrefix, rest)) {
        return DeviceReference {ByName {rest}};
    }

    return {{}, aos::Error(aos::ErrorEnum::eNotSupported, ParamError(paramName, "parameter", value).c_str())};
}

} // namespace rootdev::parser
