#include "taxonomy/core_taxonomy.hpp"

namespace dataprivacy {

const DataClass& data_class(CoreTaxonomy cls) {
    switch (cls) {
        case CoreTaxonomy::Sensitive:          return SensitiveTag::data_class();
        case CoreTaxonomy::Insensitive:        return InsensitiveTag::data_class();
        case CoreTaxonomy::UnknownSensitivity: return UnknownSensitivityTag::data_class();
    }
    return UnknownSensitivityTag::data_class();
}

} // namespace dataprivacy
