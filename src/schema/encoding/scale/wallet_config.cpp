#include <quorum/schema/encoding/scale/wallet_config.hpp>

using namespace quorum::schema;

namespace quorum::schema::encoding::scale {

void encode(wallet_config<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.owners, encoder);
  encode(o.required_approvals, encoder);
}

void decode(wallet_config<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.owners, decoder);
  decode(o.required_approvals, decoder);
}

}  // namespace quorum::schema::encoding::scale
