/*
 * Copyright (C) 2026 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ROOTDEV_RESOLVER_RESOLVER_HPP_
#define ROOTDEV_RESOLVER_RESOLVER_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include <rootdev/devicereference/devicereference.hpp>

namespace rootdev::resolver {

/***********************************************************************************************************************
 * Types
 **********************************************************************************************************************/

/**
 * GPT partition table entry.
 */
struct PartitionEntry {
    int         mNum {};
    uuid::UUID  mTypeGUID {};
    uuid::UUID  mUUID {};
    std::string mName;
};

/***********************************************************************************************************************
 * Functions
 **********************************************************************************************************************/

/**
 * Returns partition device name: parent device name followed by 1-based partition number. nvme and mmcblk devices
 * get "p" separator, e.g. nvme0n1p2.
 *
 * @param parentDevice parent device name, e.g. sda.
 * @param index 0-based partition index.
 * @return std::string.
 */
std::string PartitionDeviceName(const std::string& parentDevice, int64_t index);

/**
 * Resolves GPT device reference against partition table of the parent device.
 *
 * Non GPT references are returned as is. For GPT references the first matching partition gives a name reference.
 * If no partition matches, the reference is returned unchanged and the caller should treat it as not found.
 *
 * @param ref device reference.
 * @param parentDevice parent device name, e.g. sda.
 * @param table partition table.
 * @return DeviceReference.
 */
DeviceReference ResolveFromGPTTable(
    const DeviceReference& ref, const std::string& parentDevice, const std::vector<PartitionEntry>& table);

} // namespace rootdev::resolver

#endif
