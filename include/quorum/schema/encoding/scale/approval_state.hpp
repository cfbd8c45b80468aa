#pragma once
#include <quorum/schema/approval_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace quorum::schema::encoding::scale {

void encode(approval_state<1>&& o, ::scale::Encoder& encoder);
void decode(approval_state<1>&& o, ::scale::Decoder& decoder);

}  // namespace quorum::schema::encoding::scale
