#include <quorum/schema/encoding/scale/wallet_event.hpp>
#include <quorum/schema/encoding/scale/wallet_event_record.hpp>

using namespace quorum::schema;

namespace quorum::schema::encoding::scale {

void encode(wallet_event_record<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.event_id, encoder);
  encode(o.event, encoder);
}

void decode(wallet_event_record<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.event_id, decoder);
  decode(o.event, decoder);
}

}  // namespace quorum::schema::encoding::scale
