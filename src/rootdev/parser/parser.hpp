/*
 * Copyright (C) 2026 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ROOTDEV_PARSER_PARSER_HPP_
#define ROOTDEV_PARSER_PARSER_HPP_

#include <string>

#include <core/common/tools/error.hpp>

#include <rootdev/devicereference/devicereference.hpp>

namespace rootdev::parser {

/**
 * Returns Discoverable Partitions Specification root partition type GUID for architecture.
 *
 * @param architecture architecture name: amd64, 386, arm or arm64.
 * @return RetWithError<uuid::UUID>.
 */
aos::RetWithError<uuid::UUID> GetAutodiscoveryGPTType(const std::string& architecture);

/**
 * Parses device reference boot parameter.
 *
 * Recognized formats, checked in this order:
 *  - empty value: GPT partition autodiscovery (if enabled and known for architecture);
 *  - UUID=<uuid>, /dev/disk/by-uuid/<uuid>;
 *  - LABEL=<label>, /dev/disk/by-label/<label>;
 *  - PARTUUID=<uuid>[/PARTNROFF=<n>];
 *  - /dev/disk/by-partuuid/<uuid>;
 *  - PARTLABEL=<label>, /dev/disk/by-partlabel/<label>;
 *  - /dev/<name>.
 *
 * Errors: eNotFound if value is empty and autodiscovery is not available, eNotSupported if value format is unknown,
 * eInvalidArgument if UUID is malformed, eOutOfRange if PARTNROFF value is not a non-negative integer.
 *
 * @param paramName parameter name used in error messages, e.g. root.
 * @param value parameter value.
 * @param autodetect enables GPT partition autodiscovery for empty value.
 * @param architecture architecture used to select autodiscovery partition type.
 * @return RetWithError<DeviceReference>.
 */
aos::RetWithError<DeviceReference> ParseDeviceRef(
    const std::string& paramName, const std::string& value, bool autodetect, const std::string& architecture);

} // namespace rootdev::parser

#endif
