#include <quorum/schema/encoding/scale/transaction_state.hpp>

using namespace quorum::schema;

namespace quorum::schema::encoding::scale {

void encode(transaction_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.transaction_id, encoder);
  encode(o.recipient, encoder);
  encode(o.value, encoder);
  encode(o.approval_count, encoder);
  encode(o.executed, encoder);
}

void decode(transaction_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.transaction_id, decoder);
  decode(o.recipient, decoder);
  decode(o.value, decoder);
  decode(o.approval_count, decoder);
  decode(o.executed, decoder);
}

}  // namespace quorum::schema::encoding::scale
