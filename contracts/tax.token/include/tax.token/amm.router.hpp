/**
 * Interface of the AMM router and pair factory consumed by tax.token.
 * Only the entry points the token calls are declared here.
 */

#pragma once

#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>
#include <eosio/singleton.hpp>
#include <eosio/time.hpp>

#include <vector>

namespace amm {

   using namespace eosio;
   using std::vector;

   // factory account and the wrapped native token the router pairs against
   struct [[eosio::table("config"), eosio::contract("amm.router")]] routerconfig
   {
      name            factory;
      extended_symbol wrapped_native;

      EOSLIB_SERIALIZE(routerconfig, (factory)(wrapped_native))
   };

   typedef singleton<"config"_n, routerconfig> routerconfig_singleton;

   class [[eosio::contract("amm.router")]] factory : public contract
   {
   public:
      using contract::contract;

      [[eosio::action]] void createpair(name creator, name pair, extended_symbol token0, extended_symbol token1);

      using createpair_action = action_wrapper<"createpair"_n, &factory::createpair>;
   };

   class [[eosio::contract("amm.router")]] router : public contract
   {
   public:
      using contract::contract;

      // liquidity shares are credited to `to`; native value must already be transferred to the router
      [[eosio::action]] void addliqnative(name token, asset amount_desired, asset amount_token_min,
                                          asset amount_native_min, name to, time_point_sec deadline);

      // swap that tolerates fee-on-transfer tokens, not used by tax.token yet
      [[eosio::action]] void swapfeeonxfer(name sender, asset amount_in, asset amount_out_min,
                                           vector<extended_symbol> path, name to, time_point_sec deadline);

      static routerconfig get_config(name router_account)
      {
         routerconfig_singleton configs(router_account, router_account.value);
         check(configs.exists(), "router is not configured");
         return configs.get();
      }

      using addliqnative_action = action_wrapper<"addliqnative"_n, &router::addliqnative>;
      using swapfeeonxfer_action = action_wrapper<"swapfeeonxfer"_n, &router::swapfeeonxfer>;
   };

} // namespace amm
