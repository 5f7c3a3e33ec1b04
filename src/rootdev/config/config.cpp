/*
 * Copyright (C) 2026 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <fstream>
#include <optional>
#include <typeinfo>

#include <Poco/JSON/Parser.h>
#include <Poco/String.h>

#include <core/common/tools/logger.hpp>

#include <common/utils/exception.hpp>
#include <rootdev/arch/arch.hpp>

#include "config.hpp"

namespace rootdev::config {

namespace {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

constexpr auto cDefaultParamName  = "root";
constexpr auto cDefaultAutodetect = true;

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

/**
 * Read-only JSON object view with case-insensitive key lookup.
 */
class CaseInsensitiveObject {
public:
    explicit CaseInsensitiveObject(const Poco::JSON::Object::Ptr& object)
        : mObject(object)
    {
    }

    bool Has(const std::string& key) const { return Find(key).has_value(); }

    template <typename T>
    T GetValue(const std::string& key, const T& def) const
    {
        auto value = Find(key);
        if (!value.has_value()) {
            return def;
        }

        if (value->type() != typeid(T)) {
            ROOTDEV_ERROR_THROW(aos::ErrorEnum::eInvalidArgument, key + " has invalid type");
        }

        return value->extract<T>();
    }

private:
    std::optional<Poco::Dynamic::Var> Find(const std::string& key) const
    {
        for (const auto& [name, value] : *mObject) {
            if (Poco::icompare(name, key) == 0) {
                return value;
            }
        }

        return std::nullopt;
    }

    Poco::JSON::Object::Ptr mObject;
};

std::string GetDefaultArchitecture()
{
    auto [architecture, err] = arch::GetHostArchitecture();
    ROOTDEV_ERROR_CHECK_AND_THROW(err, "can't get host architecture");

    return architecture;
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

aos::Error ParseConfig(const Poco::JSON::Object::Ptr& object, Config& config)
{
    if (object.isNull()) {
        return AOS_ERROR_WRAP(aos::Error(aos::ErrorEnum::eInvalidArgument, "config is not an object"));
    }

    try {
        const CaseInsensitiveObject wrapper(object);

        config.mParamName = wrapper.GetValue<std::string>("paramName", cDefaultParamName);
        if (config.mParamName.empty()) {
            ROOTDEV_ERROR_THROW(aos::ErrorEnum::eInvalidArgument, "paramName should not be empty");
        }

        config.mAutodetect = wrapper.GetValue<bool>("autodetect", cDefaultAutodetect);

        if (wrapper.Has("architecture")) {
            config.mArchitecture = arch::NormalizeArchitecture(wrapper.GetValue<std::string>("architecture", ""));
        } else {
            config.mArchitecture = GetDefaultArchitecture();
        }
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(common::utils::ToAosError(e));
    }

    return aos::ErrorEnum::eNone;
}

aos::RetWithError<Config> ParseConfig(const std::string& filename)
{
    LOG_DBG() << "Parse config" << aos::Log::Field("file", filename.c_str());

    std::ifstream file(filename);

    if (!file.is_open()) {
        return {Config {}, aos::Error(aos::ErrorEnum::eNotFound, "failed to open file")};
    }

    Config config {};

    try {
        Poco::JSON::Parser parser;

        auto object = parser.parse(file).extract<Poco::JSON::Object::Ptr>();

        if (auto err = ParseConfig(object, config); !err.IsNone()) {
            return {config, err};
        }
    } catch (const std::exception& e) {
        return {config, AOS_ERROR_WRAP(common::utils::ToAosError(e, aos::ErrorEnum::eInvalidArgument))};
    }

    return config;
}

} // namespace rootdev::config
