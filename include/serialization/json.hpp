#pragma once

#include "classification/classified.hpp"

#include <nlohmann/json.hpp>

/**
 * @brief nlohmann::json support for classified containers
 *
 * Opt-in: include this header where classified values are persisted or
 * loaded. Deserialization wraps the inner value straight into the
 * container; serialization writes the raw payload, so it is meant for
 * storage, never for telemetry. Formatting rules are unchanged: a
 * container still cannot be printed.
 *
 *   struct Employee {
 *       Sensitive<std::string> name;
 *       int age;
 *   };
 *   auto name = j.at("name").get<Sensitive<std::string>>();
 */
namespace nlohmann {

template<typename T, typename Tag>
struct adl_serializer<dataprivacy::Classified<T, Tag>> {
    static dataprivacy::Classified<T, Tag> from_json(const json& j) {
        return dataprivacy::Classified<T, Tag>(j.template get<T>());
    }

    static void to_json(json& j, const dataprivacy::Classified<T, Tag>& value) {
        j = value.declassify_ref();
    }
};

} // namespace nlohmann
