#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>
#include <string>

#define ISSUE(bank, to, quantity, memo) \
    {	acdm_token::token::issue_action act{ bank, { {_self, active_perm} } };\
        act.send( to, quantity, memo );}

#define BURN(bank, quantity, memo) \
    {	acdm_token::token::burn_action act{ bank, { {_self, active_perm} } };\
            act.send( quantity, memo );}

namespace acdm_token
{

    using std::string;
    using namespace eosio;

    /**
     * The `acdm.token` contract keeps the balances of a single fungible token.
     *
     * One account is the issuer: only it may issue new supply (credited to itself) and burn
     * supply out of its own balance. The market contract is the issuer of the ACDM token, so
     * minting a sale batch and burning unsold inventory both happen in the market's custody.
     *
     * Balances live in the `accounts` table scoped to the holder, keyed by symbol code.
     */
    class [[eosio::contract( "acdm.token" )]] token : public contract
    {
    public:
        using contract::contract;

        token(eosio::name receiver, eosio::name code, datastream<const char*> ds):
            contract(receiver, code, ds), _global(_self, _self.value)
        {
            if (_global.exists()) {
                _g = _global.get();

            } else { // first init
                _g = global_t{};
            }
        }

        ~token() { _global.set( _g, get_self() ); }

        /**
         * Set the issuer and the maximum supply. Can be called once.
         *
         * @param issuer - the only account allowed to issue and burn,
         * @param max_supply - the supply cap, its symbol becomes the token symbol.
         */
        ACTION init(const name& issuer, const asset& max_supply);

        /**
         *  This action issues to `to` account a `quantity` of tokens.
         *
         * @param to - the account to issue tokens to, it must be the same as the issuer,
         * @param quntity - the amount of tokens to be issued,
         * @memo - the memo string that accompanies the token issue transaction.
         */
        ACTION issue(const name &to, const asset &quantity, const string &memo);

        /**
         * The opposite for issue action, if all validations succeed,
         * it debits the supply and the issuer balance.
         *
         * @param quantity - the quantity of tokens to burn,
         * @param memo - the memo string to accompany the transaction.
         */
        ACTION burn(const asset &quantity, const string &memo);

        /**
         * Allows `from` account to transfer to `to` account the `quantity` tokens.
         * One account is debited and the other is credited with quantity tokens.
         *
         * @param from - the account to transfer from,
         * @param to - the account to be transferred to,
         * @param quantity - the quantity of tokens to be transferred,
         * @param memo - the memo string to accompany the transaction.
         */
        ACTION transfer(const name &from,
                        const name &to,
                        const asset &quantity,
                        const string &memo);

        static asset get_balance(const name &token_contract_account, const name &owner, const symbol &sym)
        {
            accounts accountstable(token_contract_account, owner.value);
            auto itr = accountstable.find(sym.code().raw());
            if (itr == accountstable.end()) return asset(0, sym);
            return itr->balance;
        }

        using issue_action      = eosio::action_wrapper<"issue"_n, &token::issue>;
        using burn_action       = eosio::action_wrapper<"burn"_n, &token::burn>;
        using transfer_action   = eosio::action_wrapper<"transfer"_n, &token::transfer>;

    private:
        struct [[eosio::table("global"), eosio::contract( "acdm.token" )]] global_t {
            asset supply;
            asset max_supply;
            name issuer;

            EOSLIB_SERIALIZE( global_t, (supply)(max_supply)(issuer) )
        };

        typedef eosio::singleton< "global"_n, global_t > global_singleton;

        global_singleton    _global;
        global_t            _g;

        struct [[eosio::table, eosio::contract( "acdm.token" )]] account
        {
            asset balance;

            uint64_t primary_key() const { return balance.symbol.code().raw(); }

            EOSLIB_SERIALIZE( account, (balance) )
        };
        typedef eosio::multi_index<"accounts"_n, account> accounts;

    private:
        void sub_balance(const name &owner, const asset &value);
        void add_balance(const name &owner, const asset &value, const name &ram_payer);
    };

}
