/*
 * Copyright (C) 2026 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <core/common/tools/logger.hpp>

#include <rootdev/parser/parser.hpp>

#include "locator.hpp"

namespace rootdev::locator {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

aos::Error DeviceLocator::Init(const DeviceReference& ref)
{
    std::lock_guard lock {mMutex};

    LOG_DBG() << "Init device locator" << aos::Log::Field("ref", ref.ToString().c_str());

    mReference = ref;
    mDevice.reset();

    return aos::ErrorEnum::eNone;
}

aos::Error DeviceLocator::Init(const config::Config& config, const std::string& value)
{
    auto [ref, err] = parser::ParseDeviceRef(config.mParamName, value, config.mAutodetect, config.mArchitecture);
    if (!err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    return Init(ref);
}

bool DeviceLocator::OnPartitionTable(
    const std::string& parentDevice, const std::vector<resolver::PartitionEntry>& table)
{
    std::lock_guard lock {mMutex};

    if (!mReference.IsGPT()) {
        return false;
    }

    auto resolved = resolver::ResolveFromGPTTable(mReference, parentDevice, table);
    if (resolved.IsGPT()) {
        return false;
    }

    LOG_INF() << "Root device reference resolved" << aos::Log::Field("ref", mReference.ToString().c_str())
              << aos::Log::Field("disk", parentDevice.c_str())
              << aos::Log::Field("device", resolved.ToString().c_str());

    mReference = resolved;

    return true;
}

bool DeviceLocator::OnBlockDevice(const std::string& name, const std::optional<FilesystemInfo>& fsInfo)
{
    std::lock_guard lock {mMutex};

    const auto matched
        = MatchesName(mReference, name) || (fsInfo.has_value() && MatchesFilesystemInfo(mReference, *fsInfo));
    if (!matched) {
        return false;
    }

    if (mDevice.has_value()) {
        LOG_WRN() << "Device already located, ignore" << aos::Log::Field("device", mDevice->c_str())
                  << aos::Log::Field("ignored", name.c_str());

        return false;
    }

    LOG_INF() << "Root device located" << aos::Log::Field("device", name.c_str());

    mDevice = name;

    return true;
}

aos::RetWithError<std::string> DeviceLocator::GetDevice() const
{
    std::lock_guard lock {mMutex};

    if (!mDevice.has_value()) {
        return {{}, aos::Error(aos::ErrorEnum::eNotFound, ("device not found: " + mReference.ToString()).c_str())};
    }

    return *mDevice;
}

DeviceReference DeviceLocator::GetReference() const
{
    std::lock_guard lock {mMutex};

    return mReference;
}

} // namespace rootdev::locator
