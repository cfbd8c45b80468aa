#pragma once
#include <quorum/schema/transaction_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace quorum::schema::encoding::scale {

void encode(transaction_state<1>&& o, ::scale::Encoder& encoder);
void decode(transaction_state<1>&& o, ::scale::Decoder& decoder);

}  // namespace quorum::schema::encoding::scale
