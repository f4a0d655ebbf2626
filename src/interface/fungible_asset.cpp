#include <schemata/common/critical.hpp>
#include <schemata/interface/fungible_asset.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace schemata::schema;

namespace schemata::interface {

namespace {

sem_id_t standard_type(const std::string_view name) {
  auto id = find_type(fungible_asset_types(), name);
  if (!id) {
    schemata::common::critical("standard type '{}' is not defined", name);
  }
  return *id;
}

}  // namespace

type_system_t fungible_asset_types() {
  return make_type_system({
      {std::string{kTypeAssetSpec},
       "struct { ticker: str<1..8>, name: str<1..40>, details: option<str>, "
       "precision: u8 }"},
      {std::string{kTypeContractTerms},
       "struct { text: str, media: option<attachment> }"},
      {std::string{kTypeAmount}, "u64"},
      {"ContractStd.Ticker", "str<1..8>"},
      {"ContractStd.Precision", "u8"},
  });
}

iface_t fungible_asset_iface(const fungible_features features) {
  auto iface = iface_t{};
  iface.name = std::string{kFungibleAssetIfaceName};
  iface.global_state = {
      global_iface_t{.name = "spec",
                     .sem_id = standard_type(kTypeAssetSpec),
                     .required = true,
                     .multiple = false},
      global_iface_t{.name = "terms",
                     .sem_id = standard_type(kTypeContractTerms),
                     .required = true,
                     .multiple = false},
      global_iface_t{
          .name = "issuedSupply",
          .sem_id = standard_type(kTypeAmount),
          .required = true,
          .multiple = has_feature(features, fungible_features::inflatable)},
  };
  iface.assignments = {
      assignment_iface_t{.name = "assetOwner",
                         .kind = owned_state_kind::fungible,
                         .required = true,
                         .multiple = true},
  };
  iface.transitions = {
      transition_iface_t{.name = "transfer", .required = true},
  };

  if (has_feature(features, fungible_features::inflatable)) {
    iface.assignments.push_back(
        assignment_iface_t{.name = "inflationAllowance",
                           .kind = owned_state_kind::fungible,
                           .required = true,
                           .multiple = true});
    iface.transitions.push_back(
        transition_iface_t{.name = "issue", .required = true});
  }
  if (has_feature(features, fungible_features::burnable)) {
    iface.global_state.push_back(
        global_iface_t{.name = "burnedSupply",
                       .sem_id = standard_type(kTypeAmount),
                       .required = false,
                       .multiple = true});
    iface.assignments.push_back(
        assignment_iface_t{.name = "burnRight",
                           .kind = owned_state_kind::declarative,
                           .required = true,
                           .multiple = true});
    iface.transitions.push_back(
        transition_iface_t{.name = "burn", .required = true});
  }
  return iface;
}

}  // namespace schemata::interface
