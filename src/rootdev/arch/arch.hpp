/*
 * Copyright (C) 2026 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ROOTDEV_ARCH_ARCH_HPP_
#define ROOTDEV_ARCH_ARCH_HPP_

#include <string>

#include <core/common/tools/error.hpp>

namespace rootdev::arch {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

constexpr auto cArchAMD64 = "amd64";
constexpr auto cArch386   = "386";
constexpr auto cArchARM   = "arm";
constexpr auto cArchARM64 = "arm64";

/***********************************************************************************************************************
 * Functions
 **********************************************************************************************************************/

/**
 * Converts kernel machine name (uname -m) to architecture name used by partition autodiscovery.
 * Unknown machine names are returned as is.
 *
 * @param machine machine name, e.g. x86_64, aarch64, armv7l.
 * @return std::string.
 */
std::string NormalizeArchitecture(const std::string& machine);

/**
 * Returns normalized architecture of the running kernel.
 *
 * @return RetWithError<std::string>.
 */
aos::RetWithError<std::string> GetHostArchitecture();

} // namespace rootdev::arch

#endif
