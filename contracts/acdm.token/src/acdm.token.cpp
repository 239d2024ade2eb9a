#include <acdm.token/acdm.token.hpp>
using namespace std;

namespace acdm_token {

void token::init(const name& issuer, const asset& max_supply)
{
    require_auth( _self );
    check( _g.issuer.value == 0, "token already initialized" );
    check( is_account(issuer), "issuer account does not exist" );
    check( max_supply.symbol.is_valid(), "invalid symbol name" );
    check( max_supply.is_valid(), "invalid supply" );
    check( max_supply.amount > 0, "max-supply must be positive" );

    _g.issuer       = issuer;
    _g.max_supply   = max_supply;
    _g.supply       = asset(0, max_supply.symbol);
}

void token::issue(const name &to, const asset &quantity, const string &memo)
{
    check( _g.issuer.value != 0, "token not initialized" );
    require_auth( _g.issuer );

    check(to == _g.issuer, "tokens can only be issued to issuer account");
    check(memo.size() <= 256, "memo has more than 256 bytes");
    check(quantity.is_valid(), "invalid quantity");
    check(quantity.amount > 0, "must issue positive quantity");
    check(quantity.symbol == _g.max_supply.symbol, "symbol precision mismatch");
    check(quantity.amount <= _g.max_supply.amount - _g.supply.amount, "quantity exceeds available supply");

    _g.supply += quantity;

    add_balance(_g.issuer, quantity, _g.issuer);
}

void token::burn(const asset &quantity, const string &memo)
{
    check( _g.issuer.value != 0, "token not initialized" );
    require_auth(_g.issuer);

    const auto& sym = quantity.symbol;
    check(sym.is_valid(), "invalid symbol name");
    check(memo.size() <= 256, "memo has more than 256 bytes");
    check(quantity.is_valid(), "invalid quantity");
    check(quantity.amount > 0, "must burn positive quantity");
    check(quantity.symbol == _g.supply.symbol, "symbol mismatch");
    check(_g.supply >= quantity, "supply over-burnt");

    _g.supply -= quantity;

    sub_balance(_g.issuer, quantity);
}

void token::transfer(const name &from, const name &to, const asset &quantity, const string &memo)
{
    require_auth(from);

    check( from != to, "cannot transfer to self" );
    check( is_account(to), "to account does not exist" );
    check( _g.supply.symbol == quantity.symbol, "symbol mismatch" );
    check( quantity.is_valid(), "invalid quantity" );
    check( quantity.amount > 0, "must transfer positive quantity" );
    check( memo.size() <= 256, "memo has more than 256 bytes" );

    require_recipient( from );
    require_recipient( to );

    auto payer = has_auth(to) ? to : from;

    sub_balance(from, quantity);
    add_balance(to, quantity, payer);
}

void token::sub_balance(const name &owner, const asset &value)
{
    accounts accts( get_self(), owner.value );
    auto itr = accts.find( value.symbol.code().raw() );
    check( itr != accts.end(), "no balance object found" );
    check( itr->balance >= value, "overdrawn balance" );

    accts.modify( itr, same_payer, [&]( auto& row ) { row.balance -= value; } );
}

// creates the row on first credit, paid by ram_payer
void token::add_balance(const name &owner, const asset &value, const name &ram_payer)
{
    accounts accts( get_self(), owner.value );
    auto itr = accts.find( value.symbol.code().raw() );
    if (itr == accts.end()) {
        accts.emplace( ram_payer, [&]( auto& row ) { row.balance = value; } );
    } else {
        accts.modify( itr, same_payer, [&]( auto& row ) { row.balance += value; } );
    }
}

} /// namespace acdm_token
