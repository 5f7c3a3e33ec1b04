/*
 * Copyright (C) 2026 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ROOTDEV_DEVICEREFERENCE_DEVICEREFERENCE_HPP_
#define ROOTDEV_DEVICEREFERENCE_DEVICEREFERENCE_HPP_

#include <string>
#include <utility>
#include <variant>

#include <core/common/types/common.hpp>

#include <rootdev/uuid/uuid.hpp>

namespace rootdev {

/***********************************************************************************************************************
 * Types
 **********************************************************************************************************************/

class DeviceRefFormatType {
public:
    enum class Enum {
        eName,
        eGPTType,
        eGPTUUID,
        eGPTUUIDWithOffset,
        eGPTLabel,
        eFSUUID,
        eFSLabel,
    };

    static const aos::Array<const char* const> GetStrings()
    {
        static const char* const sStrings[] = {
            "name",
            "gptType",
            "gptUUID",
            "gptUUIDWithOffset",
            "gptLabel",
            "fsUUID",
            "fsLabel",
        };

        return aos::Array<const char* const>(sStrings, aos::ArraySize(sStrings));
    };
};

using DeviceRefFormatEnum = DeviceRefFormatType::Enum;
using DeviceRefFormat     = aos::EnumStringer<DeviceRefFormatType>;

/**
 * Filesystem metadata of a block device.
 */
struct FilesystemInfo {
    uuid::UUID  mUUID {};
    std::string mLabel;
};

/**
 * Device name relative to /dev, e.g. sda1.
 */
struct ByName {
    std::string mName;

    bool operator==(const ByName& other) const { return mName == other.mName; }
    bool operator!=(const ByName& other) const { return !(*this == other); }
};

/**
 * GPT partition type GUID.
 */
struct ByGPTType {
    uuid::UUID mTypeGUID {};

    bool operator==(const ByGPTType& other) const { return mTypeGUID == other.mTypeGUID; }
    bool operator!=(const ByGPTType& other) const { return !(*this == other); }
};

/**
 * GPT partition UUID.
 */
struct ByGPTUUID {
    uuid::UUID mUUID {};

    bool operator==(const ByGPTUUID& other) const { return mUUID == other.mUUID; }
    bool operator!=(const ByGPTUUID& other) const { return !(*this == other); }
};

/**
 * Partition located at offset from GPT partition with UUID.
 */
struct ByGPTUUIDWithOffset {
    uuid::UUID mUUID {};
    int        mOffset {};

    bool operator==(const ByGPTUUIDWithOffset& other) const
    {
        return mUUID == other.mUUID && mOffset == other.mOffset;
    }

    bool operator!=(const ByGPTUUIDWithOffset& other) const { return !(*this == other); }
};

/**
 * GPT partition label.
 */
struct ByGPTLabel {
    std::string mLabel;

    bool operator==(const ByGPTLabel& other) const { return mLabel == other.mLabel; }
    bool operator!=(const ByGPTLabel& other) const { return !(*this == other); }
};

/**
 * Filesystem UUID.
 */
struct ByFSUUID {
    uuid::UUID mUUID {};

    bool operator==(const ByFSUUID& other) const { return mUUID == other.mUUID; }
    bool operator!=(const ByFSUUID& other) const { return !(*this == other); }
};

/**
 * Filesystem label.
 */
struct ByFSLabel {
    std::string mLabel;

    bool operator==(const ByFSLabel& other) const { return mLabel == other.mLabel; }
    bool operator!=(const ByFSLabel& other) const { return !(*this == other); }
};

/**
 * Device reference. Alternatives order matches DeviceRefFormatEnum.
 */
class DeviceReference {
public:
    using Payload
        = std::variant<ByName, ByGPTType, ByGPTUUID, ByGPTUUIDWithOffset, ByGPTLabel, ByFSUUID, ByFSLabel>;

    /**
     * Creates empty name reference.
     */
    DeviceReference() = default;

    /**
     * Creates device reference.
     *
     * @param payload reference payload.
     */
    explicit DeviceReference(Payload payload)
        : mPayload(std::move(payload))
    {
    }

    /**
     * Returns reference format.
     *
     * @return DeviceRefFormat.
     */
    DeviceRefFormat GetFormat() const { return DeviceRefFormat(static_cast<DeviceRefFormatEnum>(mPayload.index())); }

    /**
     * Returns reference payload.
     *
     * @return const Payload&.
     */
    const Payload& GetPayload() const { return mPayload; }

    /**
     * Returns payload of the given alternative or nullptr if reference has another format.
     *
     * @return const T*.
     */
    template <typename T>
    const T* GetIf() const
    {
        return std::get_if<T>(&mPayload);
    }

    /**
     * Checks if reference is one of GPT formats and requires a partition table to be resolved.
     *
     * @return bool.
     */
    bool IsGPT() const;

    /**
     * Returns reference as a boot parameter-like string, e.g. PARTUUID=<uuid>/PARTNROFF=1.
     *
     * @return std::string.
     */
    std::string ToString() const;

    bool operator==(const DeviceReference& other) const { return mPayload == other.mPayload; }
    bool operator!=(const DeviceReference& other) const { return !(*this == other); }

private:
    Payload mPayload;
};

/***********************************************************************************************************************
 * Functions
 **********************************************************************************************************************/

/**
 * Checks if reference points to the device with the given name. Only name references can match.
 *
 * @param ref device reference.
 * @param name device name relative to /dev.
 * @return bool.
 */
bool MatchesName(const DeviceReference& ref, const std::string& name);

/**
 * Checks if reference matches filesystem metadata. Only filesystem UUID and label references can match.
 *
 * @param ref device reference.
 * @param info filesystem info.
 * @return bool.
 */
bool MatchesFilesystemInfo(const DeviceReference& ref, const FilesystemInfo& info);

} // namespace rootdev

#endif
