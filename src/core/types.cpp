/// @file src/core/types.cpp

#include "datahub/types.hpp"

namespace datahub {

std::string to_string(const SymbolKey& key) {
    return key.exchange + ":" + key.symbol;
}

}  // namespace datahub
