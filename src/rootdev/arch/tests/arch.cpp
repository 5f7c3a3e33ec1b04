/*
 * Copyright (C) 2026 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <sys/utsname.h>

#include <gtest/gtest.h>

#include <core/common/tests/utils/log.hpp>
#include <core/common/tests/utils/utils.hpp>

#include <rootdev/arch/arch.hpp>

using namespace testing;

namespace rootdev::arch {

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class ArchTest : public Test {
protected:
    static void SetUpTestSuite() { aos::tests::utils::InitLog(); }
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(ArchTest, NormalizeKnownMachines)
{
    EXPECT_EQ(NormalizeArchitecture("x86_64"), cArchAMD64);
    EXPECT_EQ(NormalizeArchitecture("amd64"), cArchAMD64);
    EXPECT_EQ(NormalizeArchitecture("aarch64"), cArchARM64);
    EXPECT_EQ(NormalizeArchitecture("arm64"), cArchARM64);
    EXPECT_EQ(NormalizeArchitecture("i386"), cArch386);
    EXPECT_EQ(NormalizeArchitecture("i686"), cArch386);
    EXPECT_EQ(NormalizeArchitecture("386"), cArch386);
    EXPECT_EQ(NormalizeArchitecture("armv7l"), cArchARM);
    EXPECT_EQ(NormalizeArchitecture("armv6l"), cArchARM);
    EXPECT_EQ(NormalizeArchitecture("arm"), cArchARM);
}

TEST_F(ArchTest, NormalizeUnknownMachine)
{
    EXPECT_EQ(NormalizeArchitecture("riscv64"), "riscv64");
    EXPECT_EQ(NormalizeArchitecture("ia64"), "ia64");
    EXPECT_EQ(NormalizeArchitecture(""), "");
}

TEST_F(ArchTest, GetHostArchitecture)
{
    struct utsname buffer;

    ASSERT_EQ(uname(&buffer), 0);

    auto [arch, err] = GetHostArchitecture();
    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);

    EXPECT_EQ(arch, NormalizeArchitecture(buffer.machine));
}

} // namespace rootdev::arch
