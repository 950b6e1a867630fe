#include <tax.token/tax.token.hpp>

void taxtoken::on_native_transfer(name from, name to, asset quantity, string memo)
{
    if (to != get_self() || from == get_self())
        return;

    // anything else is accepted as a plain deposit
    if (quantity.symbol != NATIVE_SYM || memo != liquidity_memo || !configuration.exists())
        return;

    auto conf = get_config();
    if (from != conf.controller)
        return;

    conf.pending_native += quantity;
    set_config(conf);

    print("\nLiquidity value attached: ", conf.pending_native);
}

void taxtoken::addliquidity(name controller, asset quantity)
{
    auto conf = get_config();
    require_controller(conf, controller);

    check(quantity.is_valid(), "invalid quantity");
    check(quantity.amount > 0, "must add positive quantity");
    check(quantity.symbol == conf.token_symbol, "symbol precision mismatch");
    check(conf.pending_native.amount >= min_liquidity_value, "insufficient native value");

    const asset native_value = conf.pending_native;
    conf.pending_native.amount = 0;
    set_config(conf);

    // the router pulls the tokens from our own balance through transferfrom
    set_allowance(get_self(), conf.router, quantity, get_self());

    action(permission_level{get_self(), "active"_n}, NATIVE_TOKEN_ACCOUNT, "transfer"_n,
           make_tuple(get_self(), conf.router, native_value, std::string(liquidity_memo)))
        .send();

    // zero minimums: no slippage protection
    amm::router::addliqnative_action addliq(conf.router, {get_self(), "active"_n});
    addliq.send(get_self(), quantity, asset(0, quantity.symbol), asset(0, NATIVE_SYM), conf.controller,
                time_point_sec(current_time_point()));

    logliquidity_action(get_self(), {get_self(), "active"_n}).send(quantity, native_value);

    print("\nLiquidity added: ", quantity, " with ", native_value);
}
