#pragma once

#include "classification/classified.hpp"
#include "classification/data_class.hpp"

namespace dataprivacy {

inline constexpr const char* kCoreTaxonomy = "core";

/**
 * @brief Universal data classes, for libraries agnostic of any company taxonomy
 *
 * - Sensitive:          data that must be treated carefully
 * - Insensitive:        data explicitly known not to be classified
 * - UnknownSensitivity: data whose classification is not known
 */
enum class CoreTaxonomy {
    Sensitive,
    Insensitive,
    UnknownSensitivity
};

DATAPRIVACY_DATA_CLASS(Sensitive, kCoreTaxonomy, "sensitive");
DATAPRIVACY_DATA_CLASS(Insensitive, kCoreTaxonomy, "insensitive");
DATAPRIVACY_DATA_CLASS(UnknownSensitivity, kCoreTaxonomy, "unknown_sensitivity");

[[nodiscard]] const DataClass& data_class(CoreTaxonomy cls);

} // namespace dataprivacy
