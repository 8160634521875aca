#pragma once

#include <string>
#include <string_view>

#include "doccache/v1.hpp"
#include "internal/model/maybe_document.hpp"

namespace doccache::serializer {

/*
  Record codec for the remote_documents table.

  Encode() is deterministic. Decode() throws util::Corruption for anything
  it did not write: such a record means storage or a foreign writer broke the
  table's contract, and there is nothing sensible to fall back to.
*/
class LocalSerializer {
 public:
  std::string          Encode(const model::MaybeDocument& doc) const;
  model::MaybeDocument Decode(std::string_view bytes) const;

  v1::MaybeDocument    ToProto(const model::MaybeDocument& doc) const;
  model::MaybeDocument FromProto(const v1::MaybeDocument& proto) const;

 private:
  static v1::DocumentKey    EncodeKey(const model::DocumentKey& key);
  static model::DocumentKey DecodeKey(const v1::DocumentKey& proto);
};

} // namespace doccache::serializer
