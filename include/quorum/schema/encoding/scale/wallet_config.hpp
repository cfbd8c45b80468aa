#pragma once
#include <quorum/schema/wallet_config.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace quorum::schema::encoding::scale {

void encode(wallet_config<1>&& o, ::scale::Encoder& encoder);
void decode(wallet_config<1>&& o, ::scale::Decoder& decoder);

}  // namespace quorum::schema::encoding::scale
