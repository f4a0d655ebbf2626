#pragma once
#include <schemata/schema/iface.hpp>
#include <schemata/schema/primitives.hpp>
#include <schemata/schema/type_system.hpp>

#include <cstdint>
#include <string_view>

// Fungible asset interface and the standard types it is expressed in.
namespace schemata::interface {

inline constexpr auto kStandardsIdentity =
    std::string_view{"ssi:schemata-standards"};

inline constexpr auto kFungibleAssetIfaceName =
    std::string_view{"FungibleAsset"};

// Qualified names in the standard type system.
inline constexpr auto kTypeAssetSpec = std::string_view{"ContractStd.AssetSpec"};
inline constexpr auto kTypeContractTerms =
    std::string_view{"ContractStd.ContractTerms"};
inline constexpr auto kTypeAmount = std::string_view{"ContractStd.Amount"};

enum class fungible_features : uint8_t {
  none = 0,
  inflatable = 1 << 0,
  burnable = 1 << 1,
};

constexpr fungible_features operator|(const fungible_features lhs,
                                      const fungible_features rhs) {
  return static_cast<fungible_features>(static_cast<uint8_t>(lhs) |
                                        static_cast<uint8_t>(rhs));
}

constexpr bool has_feature(const fungible_features set,
                           const fungible_features feature) {
  return (static_cast<uint8_t>(set) & static_cast<uint8_t>(feature)) != 0;
}

schemata::schema::type_system_t fungible_asset_types();

// Base interface: spec, terms, issuedSupply, assetOwner, transfer. The
// inflatable feature adds an inflation allowance and an `issue` transition
// and makes issuedSupply multiple; the burnable feature adds a burn right,
// a `burn` transition and a burnedSupply field.
schemata::schema::iface_t fungible_asset_iface(fungible_features features);

}  // namespace schemata::interface
