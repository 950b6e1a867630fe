/**
 * Fixed-supply token with a buy/sell transfer tax and a one-way trading gate.
 *
 * Taxed transfers are split between a dev, a marketing and a liquidity wallet.
 * All configuration is restricted to the controller set at init.
 */

#pragma once

#include <eosio/eosio.hpp>
#include <eosio/system.hpp>
#include <eosio/asset.hpp>
#include <eosio/singleton.hpp>

#include <tax.token/amm.router.hpp>
#include <tax.token/taxtoken.constants.hpp>

#include <string>

using namespace std;
using namespace eosio;

class [[eosio::contract("tax.token")]] taxtoken : public contract
{
public:
    using contract::contract;
    taxtoken(name receiver, name code, datastream<const char *> ds) : contract(receiver, code, ds), configuration(receiver, receiver.value) {}

    // one-shot construction: mints supply to controller, registers wallets and creates the AMM pair
    [[eosio::action]]
    void init(name controller, string token_name, asset supply, name dev_wallet, name marketing_wallet,
              name liquidity_wallet, name router, name pair);

    [[eosio::action]]
    void enabletrade(name controller);

    [[eosio::action]]
    void settaxrates(name controller, uint8_t buy_tax, uint8_t sell_tax, uint8_t dev_fee);

    [[eosio::action]]
    void setwallets(name controller, name dev_wallet, name marketing_wallet, name liquidity_wallet);

    [[eosio::action]]
    void setexempt(name controller, name account, bool exempt);

    [[eosio::action]]
    void transfer(name from, name to, asset quantity, string memo);

    [[eosio::action]]
    void approve(name owner, name spender, asset quantity);

    [[eosio::action]]
    void transferfrom(name spender, name from, name to, asset quantity, string memo);

    [[eosio::action]]
    void addliquidity(name controller, asset quantity);

    [[eosio::on_notify("eosio.token::transfer")]]
    void on_native_transfer(name from, name to, asset quantity, string memo);

    [[eosio::action]]
    void logtrading(name controller);

    [[eosio::action]]
    void logexempt(name account, bool exempt);

    [[eosio::action]]
    void logtaxrates(uint8_t buy_tax, uint8_t sell_tax, uint8_t dev_fee);

    [[eosio::action]]
    void logwallets(name dev_wallet, name marketing_wallet, name liquidity_wallet);

    [[eosio::action]]
    void logliquidity(asset quantity, asset native_value);

    [[eosio::action]]
    void logtax(name from, name to, asset dev_amount, asset marketing_amount, asset liquidity_amount);

    static bool is_exempt(name token_contract_account, name account)
    {
        exemptions exempttable(token_contract_account, token_contract_account.value);
        return exempttable.find(account.value) != exempttable.end();
    }

    TABLE account {
        asset balance;

        uint64_t primary_key() const { return balance.symbol.code().raw(); }
    };

    TABLE currency_stats {
        asset supply;
        asset max_supply;
        name issuer;

        uint64_t primary_key() const { return supply.symbol.code().raw(); }
    };

    // scoped by owner
    TABLE allowance {
        name spender;
        asset quantity;

        uint64_t primary_key() const { return spender.value; }
    };

    TABLE exemption {
        name account;

        uint64_t primary_key() const { return account.value; }
    };

    typedef multi_index<"accounts"_n, account> accounts;
    typedef multi_index<"stat"_n, currency_stats> stats;
    typedef multi_index<"allowances"_n, allowance> allowances;
    typedef multi_index<"exempt"_n, exemption> exemptions;

private:
    static constexpr symbol NATIVE_SYM = symbol("TLOS", 4);

    TABLE tokenconfig {
        name controller;
        string token_name;
        symbol token_symbol;
        name router;
        name factory;
        name pair;
        name dev_wallet;
        name marketing_wallet;
        name liquidity_wallet;
        uint8_t buy_tax = default_buy_tax;
        uint8_t sell_tax = default_sell_tax;
        uint8_t dev_fee = default_dev_fee;
        bool trading_enabled = false;
        asset pending_native;

        EOSLIB_SERIALIZE(tokenconfig, (controller)(token_name)(token_symbol)(router)(factory)(pair)
            (dev_wallet)(marketing_wallet)(liquidity_wallet)(buy_tax)(sell_tax)(dev_fee)
            (trading_enabled)(pending_native))
    };

    struct tax_split {
        asset tax;
        asset dev;
        asset marketing;
        asset liquidity;
        asset net;
    };

    typedef eosio::singleton<"config"_n, tokenconfig> config_table;

    using logtrading_action = action_wrapper<"logtrading"_n, &taxtoken::logtrading>;
    using logexempt_action = action_wrapper<"logexempt"_n, &taxtoken::logexempt>;
    using logtaxrates_action = action_wrapper<"logtaxrates"_n, &taxtoken::logtaxrates>;
    using logwallets_action = action_wrapper<"logwallets"_n, &taxtoken::logwallets>;
    using logliquidity_action = action_wrapper<"logliquidity"_n, &taxtoken::logliquidity>;
    using logtax_action = action_wrapper<"logtax"_n, &taxtoken::logtax>;

    config_table configuration;

    tokenconfig get_config();
    void set_config(const tokenconfig &conf);
    void require_controller(const tokenconfig &conf, name caller);
    void check_wallets(name dev_wallet, name marketing_wallet, name liquidity_wallet);

    void check_transfer(const tokenconfig &conf, name from, name to, const asset &quantity, const string &memo);
    void move_tokens(const tokenconfig &conf, name from, name to, const asset &quantity, name ram_payer);
    tax_split split_tax(const tokenconfig &conf, const asset &quantity, uint8_t rate) const;

    void sub_balance(name owner, asset value);
    void add_balance(name owner, asset value, name ram_payer);
    void set_allowance(name owner, name spender, asset value, name ram_payer);
    void sub_allowance(name owner, name spender, asset value);
    void add_exempt(name account);
};
