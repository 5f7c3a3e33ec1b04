/*
 * Copyright (C) 2026 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <optional>

#include <core/common/tools/logger.hpp>

#include "resolver.hpp"

namespace rootdev::resolver {

namespace {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

const char* const cPartitionSeparatorPrefixes[] = {"nvme", "mmcblk"};

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

bool NeedsPartitionSeparator(const std::string& parentDevice)
{
    for (const auto prefix : cPartitionSeparatorPrefixes) {
        if (parentDevice.rfind(prefix, 0) == 0) {
            return true;
        }
    }

    return false;
}

std::optional<int64_t> MatchPartition(const DeviceReference& ref, const PartitionEntry& entry)
{
    switch (ref.GetFormat().GetValue()) {
    case DeviceRefFormatEnum::eGPTType:
        if (ref.GetIf<ByGPTType>()->mTypeGUID == entry.mTypeGUID) {
            return entry.mNum;
        }

        break;

    case DeviceRefFormatEnum::eGPTUUID:
        if (ref.GetIf<ByGPTUUID>()->mUUID == entry.mUUID) {
            return entry.mNum;
        }

        break;

    case DeviceRefFormatEnum::eGPTUUIDWithOffset: {
        const auto byOffset = ref.GetIf<ByGPTUUIDWithOffset>();

        // matched partition is an anchor, target partition may be absent in the table
        if (byOffset->mUUID == entry.mUUID) {
            return static_cast<int64_t>(entry.mNum) + byOffset->mOffset;
        }

        break;
    }

    case DeviceRefFormatEnum::eGPTLabel:
        if (ref.GetIf<ByGPTLabel>()->mLabel == entry.mName) {
            return entry.mNum;
        }

        break;

    default:
        break;
    }

    return std::nullopt;
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

std::string PartitionDeviceName(const std::string& parentDevice, int64_t index)
{
    auto name = parentDevice;

    if (NeedsPartitionSeparator(parentDevice)) {
        name += "p";
    }

    // device partition numbers start from 1
    return name + std::to_string(index + 1);
}

DeviceReference ResolveFromGPTTable(
    const DeviceReference& ref, const std::string& parentDevice, const std::vector<PartitionEntry>& table)
{
    if (!ref.IsGPT()) {
        return ref;
    }

    for (const auto& entry : table) {
        if (auto index = MatchPartition(ref, entry); index.has_value()) {
            auto name = PartitionDeviceName(parentDevice, *index);

            LOG_DBG() << "GPT reference resolved" << aos::Log::Field("ref", ref.ToString().c_str())
                      << aos::Log::Field("device", name.c_str());

            return DeviceReference {ByName {name}};
        }
    }

    return ref;
}

} // namespace rootdev::resolver
