/*
 * Copyright (C) 2026 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cerrno>
#include <cstring>
#include <regex>
#include <sys/utsname.h>

#include <core/common/tools/logger.hpp>

#include "arch.hpp"

namespace rootdev::arch {

namespace {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

const std::regex& I386Regex()
{
    static const std::regex sRegex {"^i[3-6]86$"};

    return sRegex;
}

const std::regex& ARMRegex()
{
    static const std::regex sRegex {"^arm(v[0-9]+[a-z]*)?$"};

    return sRegex;
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

std::string NormalizeArchitecture(const std::string& machine)
{
    if (machine == "x86_64" || machine == "amd64") {
        return cArchAMD64;
    }

    if (machine == "aarch64" || machine == "arm64") {
        return cArchARM64;
    }

    if (machine == cArch386 || std::regex_match(machine, I386Regex())) {
        return cArch386;
    }

    if (std::regex_match(machine, ARMRegex())) {
        return cArchARM;
    }

    return machine;
}

aos::RetWithError<std::string> GetHostArchitecture()
{
    struct utsname buffer;

    if (auto ret = uname(&buffer); ret != 0) {
        return {{}, AOS_ERROR_WRAP(aos::Error(aos::ErrorEnum::eFailed, strerror(errno)))};
    }

    auto arch = NormalizeArchitecture(buffer.machine);

    LOG_DBG() << "Host architecture" << aos::Log::Field("machine", buffer.machine)
              << aos::Log::Field("arch", arch.c_str());

    return arch;
}

} // namespace rootdev::arch
