#include "zksha512/plonk/column.hpp"

#include <tinyformat.h>

namespace libzksha512 {

std::string column::to_string() const
{
    switch (type) {
        case ADVICE_COLUMN:
            return tfm::format("advice[%d]", index);
        case FIXED_COLUMN:
            return tfm::format("fixed[%d]", index);
        case INSTANCE_COLUMN:
            return tfm::format("instance[%d]", index);
    }
    return tfm::format("column[%d]", index);
}

std::string cell::to_string() const
{
    return tfm::format("%s@%d", col.to_string(), row);
}

} // libzksha512
