/*
 * Copyright (C) 2026 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "devicereference.hpp"

namespace rootdev {

namespace {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

std::string RefToString(const ByName& ref)
{
    return "/dev/" + ref.mName;
}

std::string RefToString(const ByGPTType& ref)
{
    return "PARTTYPE=" + uuid::UUIDToString(ref.mTypeGUID);
}

std::string RefToString(const ByGPTUUID& ref)
{
    return "PARTUUID=" + uuid::UUIDToString(ref.mUUID);
}

std::string RefToString(const ByGPTUUIDWithOffset& ref)
{
    return "PARTUUID=" + uuid::UUIDToString(ref.mUUID) + "/PARTNROFF=" + std::to_string(ref.mOffset);
}

std::string RefToString(const ByGPTLabel& ref)
{
    return "PARTLABEL=" + ref.mLabel;
}

std::string RefToString(const ByFSUUID& ref)
{
    return "UUID=" + uuid::UUIDToString(ref.mUUID);
}

std::string RefToString(const ByFSLabel& ref)
{
    return "LABEL=" + ref.mLabel;
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

bool DeviceReference::IsGPT() const
{
    switch (GetFormat().GetValue()) {
    case DeviceRefFormatEnum::eGPTType:
    case DeviceRefFormatEnum::eGPTUUID:
    case DeviceRefFormatEnum::eGPTUUIDWithOffset:
    case DeviceRefFormatEnum::eGPTLabel:
        return true;

    default:
        return false;
    }
}

std::string DeviceReference::ToString() const
{
    return std::visit([](const auto& ref) { return RefToString(ref); }, mPayload);
}

bool MatchesName(const DeviceReference& ref, const std::string& name)
{
    const auto byName = ref.GetIf<ByName>();

    return byName && byName->mName == name;
}

bool MatchesFilesystemInfo(const DeviceReference& ref, const FilesystemInfo& info)
{
    if (const auto byUUID = ref.GetIf<ByFSUUID>(); byUUID) {
        return byUUID->mUUID == info.mUUID;
    }

    if (const auto byLabel = ref.GetIf<ByFSLabel>(); byLabel) {
        return byLabel->mLabel == info.mLabel;
    }

    return false;
}

} // namespace rootdev
