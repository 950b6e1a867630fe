#include <tax.token/tax.token.hpp>

void taxtoken::init(name controller, string token_name, asset supply, name dev_wallet, name marketing_wallet,
                    name liquidity_wallet, name router, name pair)
{
    require_auth(get_self());
    check(!configuration.exists(), "token is already initialized");

    auto sym = supply.symbol;
    check(sym.is_valid(), "invalid symbol name");
    check(supply.is_valid(), "invalid supply");
    check(supply.amount > 0, "supply must be positive");
    check(token_name.size() <= 64, "token name has more than 64 bytes");

    check(controller != name(), "controller cannot be the null account");
    check(is_account(controller), "controller account does not exist");
    check(router != name() && is_account(router), "router account does not exist");
    check(pair != name() && is_account(pair), "pair account does not exist");
    check_wallets(dev_wallet, marketing_wallet, liquidity_wallet);

    // pair factory and wrapped native symbol
    auto router_conf = amm::router::get_config(router);

    stats statstable(get_self(), sym.code().raw());
    statstable.emplace(get_self(), [&](auto &s) {
        s.supply = supply;
        s.max_supply = supply;
        s.issuer = controller;
    });

    add_balance(controller, supply, get_self());

    tokenconfig conf;
    conf.controller = controller;
    conf.token_name = token_name;
    conf.token_symbol = sym;
    conf.router = router;
    conf.factory = router_conf.factory;
    conf.pair = pair;
    conf.dev_wallet = dev_wallet;
    conf.marketing_wallet = marketing_wallet;
    conf.liquidity_wallet = liquidity_wallet;
    conf.pending_native = asset(0, NATIVE_SYM);
    set_config(conf);

    add_exempt(controller);
    add_exempt(dev_wallet);
    add_exempt(marketing_wallet);
    add_exempt(liquidity_wallet);

    amm::factory::createpair_action createpair(router_conf.factory, {get_self(), "active"_n});
    createpair.send(get_self(), pair, extended_symbol(sym, get_self()), router_conf.wrapped_native);

    print("\nToken initialized: ", supply, " issued to ", controller, ", pair ", pair);
}

void taxtoken::enabletrade(name controller)
{
    auto conf = get_config();
    require_controller(conf, controller);
    check(!conf.trading_enabled, "trading is already enabled");

    conf.trading_enabled = true;
    set_config(conf);

    logtrading_action(get_self(), {get_self(), "active"_n}).send(controller);
}

void taxtoken::settaxrates(name controller, uint8_t buy_tax, uint8_t sell_tax, uint8_t dev_fee)
{
    auto conf = get_config();
    require_controller(conf, controller);
    check(buy_tax <= max_buy_tax && sell_tax <= max_sell_tax && dev_fee <= max_dev_fee, "tax rate exceeds its cap");

    conf.buy_tax = buy_tax;
    conf.sell_tax = sell_tax;
    conf.dev_fee = dev_fee;
    set_config(conf);

    logtaxrates_action(get_self(), {get_self(), "active"_n}).send(buy_tax, sell_tax, dev_fee);
}

void taxtoken::setwallets(name controller, name dev_wallet, name marketing_wallet, name liquidity_wallet)
{
    auto conf = get_config();
    require_controller(conf, controller);
    check_wallets(dev_wallet, marketing_wallet, liquidity_wallet);

    conf.dev_wallet = dev_wallet;
    conf.marketing_wallet = marketing_wallet;
    conf.liquidity_wallet = liquidity_wallet;
    set_config(conf);

    add_exempt(dev_wallet);
    add_exempt(marketing_wallet);
    add_exempt(liquidity_wallet);

    logwallets_action(get_self(), {get_self(), "active"_n}).send(dev_wallet, marketing_wallet, liquidity_wallet);
}

void taxtoken::setexempt(name controller, name account, bool exempt)
{
    auto conf = get_config();
    require_controller(conf, controller);

    exemptions exempttable(get_self(), get_self().value);
    auto itr = exempttable.find(account.value);
    if (exempt)
    {
        if (itr == exempttable.end())
        {
            exempttable.emplace(get_self(), [&](auto &e) {
                e.account = account;
            });
        }
    }
    else if (itr != exempttable.end())
    {
        exempttable.erase(itr);
    }

    logexempt_action(get_self(), {get_self(), "active"_n}).send(account, exempt);
}

#pragma region Events

void taxtoken::logtrading(name controller)
{
    require_auth(get_self());
}

void taxtoken::logexempt(name account, bool exempt)
{
    require_auth(get_self());
}

void taxtoken::logtaxrates(uint8_t buy_tax, uint8_t sell_tax, uint8_t dev_fee)
{
    require_auth(get_self());
}

void taxtoken::logwallets(name dev_wallet, name marketing_wallet, name liquidity_wallet)
{
    require_auth(get_self());
}

void taxtoken::logliquidity(asset quantity, asset native_value)
{
    require_auth(get_self());
}

void taxtoken::logtax(name from, name to, asset dev_amount, asset marketing_amount, asset liquidity_amount)
{
    require_auth(get_self());
}

#pragma endregion Events

#pragma region Helpers

taxtoken::tokenconfig taxtoken::get_config()
{
    check(configuration.exists(), "token is not initialized");
    return configuration.get();
}

void taxtoken::set_config(const tokenconfig &conf)
{
    configuration.set(conf, get_self());
}

void taxtoken::require_controller(const tokenconfig &conf, name caller)
{
    require_auth(caller);
    check(caller == conf.controller, "only the controller may perform this action");
}

// all-or-nothing: every wallet is validated before any is written
void taxtoken::check_wallets(name dev_wallet, name marketing_wallet, name liquidity_wallet)
{
    check(dev_wallet != name() && marketing_wallet != name() && liquidity_wallet != name(),
          "wallet cannot be the null account");
    check(is_account(dev_wallet), "dev wallet account does not exist");
    check(is_account(marketing_wallet), "marketing wallet account does not exist");
    check(is_account(liquidity_wallet), "liquidity wallet account does not exist");
}

void taxtoken::add_exempt(name account)
{
    exemptions exempttable(get_self(), get_self().value);
    if (exempttable.find(account.value) == exempttable.end())
    {
        exempttable.emplace(get_self(), [&](auto &e) {
            e.account = account;
        });
    }
}

#pragma endregion Helpers
