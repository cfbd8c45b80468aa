#pragma once
#include <quorum/schema/wallet_event_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace quorum::schema::encoding::scale {

void encode(wallet_event_record<1>&& o, ::scale::Encoder& encoder);
void decode(wallet_event_record<1>&& o, ::scale::Decoder& decoder);

}  // namespace quorum::schema::encoding::scale
