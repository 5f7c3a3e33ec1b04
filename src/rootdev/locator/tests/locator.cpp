/*
 * Copyright (C) 2026 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <future>
#include <vector>

#include <gtest/gtest.h>

#include <core/common/tests/utils/log.hpp>
#include <core/common/tests/utils/utils.hpp>

#include <rootdev/locator/locator.hpp>

using namespace testing;

namespace rootdev::locator {

namespace {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

constexpr auto cRootType = "b921b045-1df0-41c3-af44-4c6f280d3fae";
constexpr auto cESPType  = "c12a7328-f81f-11d2-ba4b-00a0c93ec93b";
constexpr auto cESPUUID  = "aaaaaaaa-0000-0000-0000-000000000001";
constexpr auto cRootUUID = "aaaaaaaa-0000-0000-0000-000000000002";
constexpr auto cFSUUID   = "bbbbbbbb-0000-0000-0000-000000000001";

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

uuid::UUID ToUUID(const char* str)
{
    return uuid::StringToUUID(str).mValue;
}

std::vector<resolver::PartitionEntry> CreateTable()
{
    return {
        {0, ToUUID(cESPType), ToUUID(cESPUUID), "esp"},
        {1, ToUUID(cRootType), ToUUID(cRootUUID), "rootfs"},
    };
}

} // namespace

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class DeviceLocatorTest : public Test {
protected:
    static void SetUpTestSuite() { aos::tests::utils::InitLog(); }

    void SetUp() override { mConfig = config::Config {"root", true, "arm64"}; }

    config::Config mConfig;
    DeviceLocator  mLocator;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(DeviceLocatorTest, LocateByName)
{
    auto err = mLocator.Init(mConfig, "/dev/sda2");
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    EXPECT_FALSE(mLocator.OnPartitionTable("sda", CreateTable()));
    EXPECT_FALSE(mLocator.OnBlockDevice("sda1", std::nullopt));
    EXPECT_TRUE(mLocator.OnBlockDevice("sda2", std::nullopt));

    auto [device, errDevice] = mLocator.GetDevice();
    ASSERT_TRUE(errDevice.IsNone()) << aos::tests::utils::ErrorToStr(errDevice);

    EXPECT_EQ(device, "sda2");
}

TEST_F(DeviceLocatorTest, LocateByFilesystemUUID)
{
    auto err = mLocator.Init(mConfig, std::string("UUID=") + cFSUUID);
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    EXPECT_FALSE(mLocator.OnBlockDevice("sda1", FilesystemInfo {ToUUID(cESPUUID), "esp"}));
    EXPECT_FALSE(mLocator.OnBlockDevice("sda2", std::nullopt));
    EXPECT_TRUE(mLocator.OnBlockDevice("sda3", FilesystemInfo {ToUUID(cFSUUID), "rootfs"}));

    EXPECT_EQ(mLocator.GetDevice().mValue, "sda3");
}

TEST_F(DeviceLocatorTest, LocateByAutodiscovery)
{
    auto err = mLocator.Init(mConfig, "");
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    EXPECT_EQ(mLocator.GetReference(), DeviceReference {ByGPTType {ToUUID(cRootType)}});

    // GPT reference is never matched directly
    EXPECT_FALSE(mLocator.OnBlockDevice("mmcblk0p2", FilesystemInfo {ToUUID(cRootUUID), "rootfs"}));

    EXPECT_TRUE(mLocator.OnPartitionTable("mmcblk0", CreateTable()));
    EXPECT_EQ(mLocator.GetReference(), DeviceReference {ByName {"mmcblk0p2"}});

    // resolved reference is not affected by other disks
    EXPECT_FALSE(mLocator.OnPartitionTable("sdb", CreateTable()));

    EXPECT_TRUE(mLocator.OnBlockDevice("mmcblk0p2", std::nullopt));
    EXPECT_EQ(mLocator.GetDevice().mValue, "mmcblk0p2");
}

TEST_F(DeviceLocatorTest, UnresolvedGPTReference)
{
    auto err = mLocator.Init(mConfig, "PARTLABEL=missing");
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    EXPECT_FALSE(mLocator.OnPartitionTable("sda", CreateTable()));
    EXPECT_TRUE(mLocator.GetReference().IsGPT());

    auto [device, errDevice] = mLocator.GetDevice();
    EXPECT_TRUE(errDevice.Is(aos::ErrorEnum::eNotFound)) << aos::tests::utils::ErrorToStr(errDevice);

    // later disk may still contain the partition
    auto table = CreateTable();

    table.push_back({2, ToUUID(cRootType), ToUUID(cFSUUID), "missing"});

    EXPECT_TRUE(mLocator.OnPartitionTable("nvme1n1", table));
    EXPECT_TRUE(mLocator.OnBlockDevice("nvme1n1p3", std::nullopt));
    EXPECT_EQ(mLocator.GetDevice().mValue, "nvme1n1p3");
}

TEST_F(DeviceLocatorTest, FirstMatchingDeviceWins)
{
    auto err = mLocator.Init(DeviceReference {ByFSLabel {"rootfs"}});
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    EXPECT_TRUE(mLocator.OnBlockDevice("sda2", FilesystemInfo {ToUUID(cFSUUID), "rootfs"}));
    EXPECT_FALSE(mLocator.OnBlockDevice("sdb2", FilesystemInfo {ToUUID(cRootUUID), "rootfs"}));

    EXPECT_EQ(mLocator.GetDevice().mValue, "sda2");
}

TEST_F(DeviceLocatorTest, InitFailsOnInvalidValue)
{
    EXPECT_TRUE(mLocator.Init(mConfig, "garbage").Is(aos::ErrorEnum::eNotSupported));

    mConfig.mAutodetect = false;

    EXPECT_TRUE(mLocator.Init(mConfig, "").Is(aos::ErrorEnum::eNotFound));
}

TEST_F(DeviceLocatorTest, ConcurrentAnnouncements)
{
    auto err = mLocator.Init(mConfig, "LABEL=rootfs");
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    constexpr auto cDevicesCount = 16;

    std::vector<std::future<bool>> results;

    for (auto i = 0; i < cDevicesCount; ++i) {
        results.push_back(std::async(std::launch::async, [this, i]() {
            return mLocator.OnBlockDevice("vd" + std::to_string(i), FilesystemInfo {ToUUID(cFSUUID), "rootfs"});
        }));
    }

    auto matched = 0;

    for (auto& result : results) {
        matched += result.get() ? 1 : 0;
    }

    EXPECT_EQ(matched, 1);
    EXPECT_TRUE(mLocator.GetDevice().mError.IsNone());
}

} // namespace rootdev::locator
