#include <tax.token/tax.token.hpp>

#include <algorithm>

void taxtoken::transfer(name from, name to, asset quantity, string memo)
{
    require_auth(from);
    auto conf = get_config();
    check_transfer(conf, from, to, quantity, memo);

    require_recipient(from);
    require_recipient(to);

    auto payer = has_auth(to) ? to : from;
    move_tokens(conf, from, to, quantity, payer);
}

void taxtoken::approve(name owner, name spender, asset quantity)
{
    require_auth(owner);
    auto conf = get_config();
    check(spender != name(), "spender cannot be the null account");
    check(owner != spender, "cannot approve self");
    check(quantity.is_valid(), "invalid quantity");
    check(quantity.amount >= 0, "must approve non-negative quantity");
    check(quantity.symbol == conf.token_symbol, "symbol precision mismatch");

    set_allowance(owner, spender, quantity, owner);
}

void taxtoken::transferfrom(name spender, name from, name to, asset quantity, string memo)
{
    require_auth(spender);
    auto conf = get_config();
    check_transfer(conf, from, to, quantity, memo);

    sub_allowance(from, spender, quantity);

    require_recipient(from);
    require_recipient(to);

    move_tokens(conf, from, to, quantity, spender);
}

void taxtoken::check_transfer(const tokenconfig &conf, name from, name to, const asset &quantity, const string &memo)
{
    check(from != name(), "from account cannot be the null account");
    check(to != name(), "to account cannot be the null account");
    check(from != to, "cannot transfer to self");
    check(is_account(to), "to account does not exist");

    check(quantity.is_valid(), "invalid quantity");
    check(quantity.amount > 0, "must transfer positive quantity");
    check(quantity.symbol == conf.token_symbol, "symbol precision mismatch");
    check(memo.size() <= max_memo_size, "memo has more than 256 bytes");
}

void taxtoken::move_tokens(const tokenconfig &conf, name from, name to, const asset &quantity, name ram_payer)
{
    const bool from_exempt = is_exempt(get_self(), from);
    const bool to_exempt = is_exempt(get_self(), to);

    if (!conf.trading_enabled)
    {
        check(from == conf.controller || to == conf.controller || from == get_self() || from_exempt || to_exempt,
              "trading is not active");
    }

    if (from_exempt || to_exempt)
    {
        sub_balance(from, quantity);
        add_balance(to, quantity, ram_payer);
        return;
    }

    uint8_t rate = 0;
    if (from == conf.pair && to != conf.router)
        rate = conf.buy_tax;
    else if (to == conf.pair && from != conf.router)
        rate = conf.sell_tax;

    auto split = split_tax(conf, quantity, rate);
    if (split.tax.amount == 0)
    {
        sub_balance(from, quantity);
        add_balance(to, quantity, ram_payer);
        return;
    }

    print("\ntax ", split.tax, " on ", quantity, " from ", from, " to ", to,
          ": dev ", split.dev, ", marketing ", split.marketing, ", liquidity ", split.liquidity);

    // each leg draws down the sender's balance in turn
    if (split.dev.amount > 0)
    {
        sub_balance(from, split.dev);
        add_balance(conf.dev_wallet, split.dev, ram_payer);
    }
    if (split.marketing.amount > 0)
    {
        sub_balance(from, split.marketing);
        add_balance(conf.marketing_wallet, split.marketing, ram_payer);
    }
    if (split.liquidity.amount > 0)
    {
        sub_balance(from, split.liquidity);
        add_balance(conf.liquidity_wallet, split.liquidity, ram_payer);
    }
    if (split.net.amount > 0)
    {
        sub_balance(from, split.net);
        add_balance(to, split.net, ram_payer);
    }

    logtax_action(get_self(), {get_self(), "active"_n}).send(from, to, split.dev, split.marketing, split.liquidity);
}

// The dev share is taken against the larger of the two configured rates,
// whichever rate was charged on this transfer.
taxtoken::tax_split taxtoken::split_tax(const tokenconfig &conf, const asset &quantity, uint8_t rate) const
{
    tax_split split{
        asset(0, quantity.symbol),
        asset(0, quantity.symbol),
        asset(0, quantity.symbol),
        asset(0, quantity.symbol),
        quantity};

    if (rate == 0)
        return split;

    const uint128_t amount = static_cast<uint128_t>(quantity.amount);
    const uint128_t tax = amount * rate / 100;
    if (tax == 0)
        return split;

    const uint8_t denominator = std::max(conf.buy_tax, conf.sell_tax);
    const uint128_t dev = tax * conf.dev_fee / denominator;
    check(dev <= tax, "dev fee exceeds applicable tax");

    const uint128_t remaining = tax - dev;
    const uint128_t marketing = remaining / 2;

    split.tax.amount = static_cast<int64_t>(tax);
    split.dev.amount = static_cast<int64_t>(dev);
    split.marketing.amount = static_cast<int64_t>(marketing);
    split.liquidity.amount = static_cast<int64_t>(remaining - marketing);
    split.net.amount = quantity.amount - split.tax.amount;
    return split;
}

void taxtoken::sub_balance(name owner, asset value)
{
    accounts from_acnts(get_self(), owner.value);

    const auto &from = from_acnts.get(value.symbol.code().raw(), "no balance object found");
    check(from.balance.amount >= value.amount, "overdrawn balance");

    from_acnts.modify(from, same_payer, [&](auto &a) {
        a.balance -= value;
    });
}

void taxtoken::add_balance(name owner, asset value, name ram_payer)
{
    accounts to_acnts(get_self(), owner.value);
    auto to = to_acnts.find(value.symbol.code().raw());
    if (to == to_acnts.end())
    {
        to_acnts.emplace(ram_payer, [&](auto &a) {
            a.balance = value;
        });
    }
    else
    {
        to_acnts.modify(to, same_payer, [&](auto &a) {
            a.balance += value;
        });
    }
}

void taxtoken::set_allowance(name owner, name spender, asset value, name ram_payer)
{
    allowances allowancetable(get_self(), owner.value);
    auto itr = allowancetable.find(spender.value);

    if (value.amount == 0)
    {
        if (itr != allowancetable.end())
            allowancetable.erase(itr);
        return;
    }

    if (itr == allowancetable.end())
    {
        allowancetable.emplace(ram_payer, [&](auto &a) {
            a.spender = spender;
            a.quantity = value;
        });
    }
    else
    {
        allowancetable.modify(itr, same_payer, [&](auto &a) {
            a.quantity = value;
        });
    }
}

void taxtoken::sub_allowance(name owner, name spender, asset value)
{
    allowances allowancetable(get_self(), owner.value);
    auto itr = allowancetable.find(spender.value);
    check(itr != allowancetable.end() && itr->quantity.amount >= value.amount, "insufficient allowance");

    if (itr->quantity.amount == value.amount)
    {
        allowancetable.erase(itr);
    }
    else
    {
        allowancetable.modify(itr, same_payer, [&](auto &a) {
            a.quantity -= value;
        });
    }
}
