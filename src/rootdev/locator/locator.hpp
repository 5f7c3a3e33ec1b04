/*
 * Copyright (C) 2026 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ROOTDEV_LOCATOR_LOCATOR_HPP_
#define ROOTDEV_LOCATOR_LOCATOR_HPP_

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <core/common/tools/error.hpp>

#include <rootdev/config/config.hpp>
#include <rootdev/devicereference/devicereference.hpp>
#include <rootdev/resolver/resolver.hpp>

namespace rootdev::locator {

/**
 * Locates block device referenced by boot parameter among announced devices.
 */
class DeviceLocator {
public:
    /**
     * Initializes locator with already parsed reference.
     *
     * @param ref device reference.
     * @return Error.
     */
    aos::Error Init(const DeviceReference& ref);

    /**
     * Initializes locator by parsing boot parameter value.
     *
     * @param config resolver configuration.
     * @param value boot parameter value.
     * @return Error.
     */
    aos::Error Init(const config::Config& config, const std::string& value);

    /**
     * Handles partition table of a disk. GPT reference is resolved to a device name if table contains matching
     * partition.
     *
     * @param parentDevice disk device name, e.g. sda.
     * @param table partition table.
     * @return true if reference has been resolved by this table.
     */
    bool OnPartitionTable(const std::string& parentDevice, const std::vector<resolver::PartitionEntry>& table);

    /**
     * Handles block device.
     *
     * @param name device name relative to /dev.
     * @param fsInfo filesystem info if device contains known filesystem.
     * @return true if device matches reference.
     */
    bool OnBlockDevice(const std::string& name, const std::optional<FilesystemInfo>& fsInfo);

    /**
     * Returns matched device name.
     *
     * @return RetWithError<std::string>.
     */
    aos::RetWithError<std::string> GetDevice() const;

    /**
     * Returns current device reference.
     *
     * @return DeviceReference.
     */
    DeviceReference GetReference() const;

private:
    mutable std::mutex         mMutex;
    DeviceReference            mReference;
    std::optional<std::string> mDevice;
};

} // namespace rootdev::locator

#endif
