#include <quorum/schema/encoding/scale/wallet_event.hpp>

using namespace quorum::schema;

namespace quorum::schema::encoding::scale {

void encode(owner_added<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.owner, encoder);
}

void decode(owner_added<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.owner, decoder);
}

void encode(deposit<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.sender, encoder);
  encode(o.amount, encoder);
}

void decode(deposit<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.sender, decoder);
  decode(o.amount, decoder);
}

void encode(proposed_transaction<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.transaction_id, encoder);
  encode(o.proposer, encoder);
  encode(o.recipient, encoder);
  encode(o.value, encoder);
}

void decode(proposed_transaction<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.transaction_id, decoder);
  decode(o.proposer, decoder);
  decode(o.recipient, decoder);
  decode(o.value, decoder);
}

void encode(approved_transaction<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.transaction_id, encoder);
  encode(o.approver, encoder);
}

void decode(approved_transaction<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.transaction_id, decoder);
  decode(o.approver, decoder);
}

void encode(already_approved_transaction<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.transaction_id, encoder);
  encode(o.approver, encoder);
}

void decode(already_approved_transaction<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.transaction_id, decoder);
  decode(o.approver, decoder);
}

void encode(transaction_executed<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.transaction_id, encoder);
  encode(o.executor, encoder);
}

void decode(transaction_executed<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.transaction_id, decoder);
  decode(o.executor, decoder);
}

}  // namespace quorum::schema::encoding::scale
