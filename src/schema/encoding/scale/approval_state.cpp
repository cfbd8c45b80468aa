#include <quorum/schema/encoding/scale/approval_state.hpp>

using namespace quorum::schema;

namespace quorum::schema::encoding::scale {

void encode(approval_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.transaction_id, encoder);
  encode(o.approver, encoder);
}

void decode(approval_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.transaction_id, decoder);
  decode(o.approver, decoder);
}

}  // namespace quorum::schema::encoding::scale
