#pragma once
#include <quorum/schema/wallet_event.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace quorum::schema::encoding::scale {

void encode(owner_added<1>&& o, ::scale::Encoder& encoder);
void decode(owner_added<1>&& o, ::scale::Decoder& decoder);

void encode(deposit<1>&& o, ::scale::Encoder& encoder);
void decode(deposit<1>&& o, ::scale::Decoder& decoder);

void encode(proposed_transaction<1>&& o, ::scale::Encoder& encoder);
void decode(proposed_transaction<1>&& o, ::scale::Decoder& decoder);

void encode(approved_transaction<1>&& o, ::scale::Encoder& encoder);
void decode(approved_transaction<1>&& o, ::scale::Decoder& decoder);

void encode(already_approved_transaction<1>&& o, ::scale::Encoder& encoder);
void decode(already_approved_transaction<1>&& o, ::scale::Decoder& decoder);

void encode(transaction_executed<1>&& o, ::scale::Encoder& encoder);
void decode(transaction_executed<1>&& o, ::scale::Decoder& decoder);

}  // namespace quorum::schema::encoding::scale
