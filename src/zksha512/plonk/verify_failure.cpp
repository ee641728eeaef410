#include "zksha512/plonk/mock_prover.hpp"

#include <tinyformat.h>

namespace libzksha512 {

std::string verify_failure::to_string() const
{
    std::string where = region.empty() ? tfm::format("row %d", row) : tfm::format("row %d (region %s)", row, region);
    switch (type) {
        case CONSTRAINT_NOT_SATISFIED:
            return tfm::format("constraint %s of gate %s not satisfied at %s", constraint, name, where);
        case LOOKUP_NOT_SATISFIED:
            return tfm::format("lookup %s not satisfied at %s", name, where);
        case PERMUTATION_NOT_SATISFIED:
            return tfm::format("copy constraint between %s and %s not satisfied", first.to_string(), second.to_string());
    }
    return "unknown failure";
}

} // libzksha512
