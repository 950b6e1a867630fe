#pragma once

// rate caps, in whole percent
const uint8_t max_buy_tax = 10;
const uint8_t max_sell_tax = 15;
const uint8_t max_dev_fee = 5;

// rates set by init
const uint8_t default_buy_tax = 5;
const uint8_t default_sell_tax = 7;
const uint8_t default_dev_fee = 2;

// 0.5000 TLOS
const int64_t min_liquidity_value = 5000;

const uint32_t max_memo_size = 256;

// memo marking a controller TLOS transfer as value attached to the next addliquidity
static constexpr const char* liquidity_memo = "liquidity";

#ifndef TESTER
#define VNAME eosio::name
#else
#define VNAME eosio::chain::name
#endif

static constexpr VNAME NATIVE_TOKEN_ACCOUNT = "eosio.token"_n;
