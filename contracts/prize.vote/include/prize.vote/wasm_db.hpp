#pragma once

#include <eosio/eosio.hpp>

namespace wasm { namespace db {

using namespace eosio;

enum return_t{
    NONE    = 0,
    MODIFIED,
    APPENDED,
};

class dbc {
private:
    name code;   //contract owner

public:
    dbc(const name& code): code(code) {}

    template<typename RecordType>
    bool get(RecordType& record) {
        typename RecordType::table_t tbl(code, record.scope());
        auto itr = tbl.find(record.primary_key());
        if (itr == tbl.end()) return false;

        record = *itr;
        return true;
    }

    template<typename RecordType>
    return_t set(const RecordType& record) {
        typename RecordType::table_t tbl(code, record.scope());

        auto itr = tbl.find( record.primary_key() );
        if ( itr != tbl.end()) {
            tbl.modify( itr, same_payer, [&]( auto& s ) {
                s = record;
            });
            return return_t::MODIFIED;
        } else {
            tbl.emplace( code, [&]( auto& s ) {
                s = record;
            });
            return return_t::APPENDED;
        }
    }

};

}}//db//wasm
