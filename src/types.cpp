#include "stockledger/types.hpp"

#include <algorithm>
#include <cctype>
#include "stockledger/errors.hpp"

namespace stockledger {

const char* adjustment_type_name(AdjustmentType type) {
    switch (type) {
        case AdjustmentType::Sale: return "SALE";
        case AdjustmentType::Return: return "RETURN";
        case AdjustmentType::Purchase: return "PURCHASE";
        case AdjustmentType::Damage: return "DAMAGE";
        case AdjustmentType::Loss: return "LOSS";
        case AdjustmentType::Correction: return "CORRECTION";
    }
    return "CORRECTION";
}

AdjustmentType parse_adjustment_type(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "SALE") return AdjustmentType::Sale;
    if (upper == "RETURN") return AdjustmentType::Return;
    if (upper == "PURCHASE") return AdjustmentType::Purchase;
    if (upper == "DAMAGE") return AdjustmentType::Damage;
    if (upper == "LOSS") return AdjustmentType::Loss;
    if (upper == "CORRECTION") return AdjustmentType::Correction;
    throw InvalidArgumentError("Unknown adjustment type: " + name);
}

} // namespace stockledger
