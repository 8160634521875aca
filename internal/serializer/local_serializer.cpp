#include "internal/serializer/local_serializer.hpp"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>

#include <type_traits>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace doccache::serializer {

v1::DocumentKey LocalSerializer::EncodeKey(const model::DocumentKey& key) {
  v1::DocumentKey proto;
  for (const auto& segment : key.path().segments()) {
    proto.add_segments(segment);
  }
  return proto;
}

model::DocumentKey LocalSerializer::DecodeKey(const v1::DocumentKey& proto) {
  std::vector<std::string> segments(proto.segments().begin(), proto.segments().end());
  model::ResourcePath      path(std::move(segments));
  if (!model::DocumentKey::IsDocumentKey(path)) {
    throw util::Corruption("MaybeDocument failed to parse: stored key '" + path.CanonicalString() + "' is not a document path");
  }
  return model::DocumentKey(std::move(path));
}

v1::MaybeDocument LocalSerializer::ToProto(const model::MaybeDocument& doc) const {
  v1::MaybeDocument proto;
  std::visit(
      [&](const auto& d) {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, model::Document>) {
          auto* out                   = proto.mutable_document();
          *out->mutable_key()         = EncodeKey(d.key);
          *out->mutable_update_time() = util::ToProto(d.version);
          out->set_fields(d.data);
          proto.set_has_local_mutations(d.state == model::DocumentState::kLocalMutations);
          proto.set_has_committed_mutations(d.state == model::DocumentState::kCommittedMutations);
        } else if constexpr (std::is_same_v<T, model::NoDocument>) {
          auto* out                 = proto.mutable_no_document();
          *out->mutable_key()       = EncodeKey(d.key);
          *out->mutable_read_time() = util::ToProto(d.version);
          proto.set_has_committed_mutations(d.has_committed_mutations);
        } else {
          static_assert(std::is_same_v<T, model::UnknownDocument>);
          auto* out               = proto.mutable_unknown_document();
          *out->mutable_key()     = EncodeKey(d.key);
          *out->mutable_version() = util::ToProto(d.version);
          proto.set_has_committed_mutations(true);
        }
      },
      doc);
  return proto;
}

model::MaybeDocument LocalSerializer::FromProto(const v1::MaybeDocument& proto) const {
  switch (proto.document_type_case()) {
    case v1::MaybeDocument::kDocument: {
      const auto& in    = proto.document();
      auto        state = model::DocumentState::kSynced;
      if (proto.has_local_mutations()) {
        state = model::DocumentState::kLocalMutations;
      } else if (proto.has_committed_mutations()) {
        state = model::DocumentState::kCommittedMutations;
      }
      return model::Document{DecodeKey(in.key()), util::FromProto(in.update_time()), in.fields(), state};
    }
    case v1::MaybeDocument::kNoDocument: {
      const auto& in = proto.no_document();
      return model::NoDocument{DecodeKey(in.key()), util::FromProto(in.read_time()), proto.has_committed_mutations()};
    }
    case v1::MaybeDocument::kUnknownDocument: {
      const auto& in = proto.unknown_document();
      return model::UnknownDocument{DecodeKey(in.key()), util::FromProto(in.version())};
    }
    case v1::MaybeDocument::DOCUMENT_TYPE_NOT_SET:
      break;
  }
  throw util::Corruption("MaybeDocument failed to parse: no document type set");
}

std::string LocalSerializer::Encode(const model::MaybeDocument& doc) const {
  const auto proto = ToProto(doc);

  std::string out;
  {
    google::protobuf::io::StringOutputStream raw(&out);
    google::protobuf::io::CodedOutputStream  coded(&raw);
    coded.SetSerializationDeterministic(true);
    if (!proto.SerializeToCodedStream(&coded)) {
      throw util::InvalidArgument("MaybeDocument failed to serialize (record exceeds the protobuf size limit): " +
                                  model::KeyOf(doc).ToString());
    }
  }
  return out;
}

model::MaybeDocument LocalSerializer::Decode(std::string_view bytes) const {
  v1::MaybeDocument proto;
  if (!proto.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
    throw util::Corruption("MaybeDocument failed to parse: " + std::to_string(bytes.size()) + " bytes are not a valid record");
  }
  return FromProto(proto);
}

} // namespace doccache::serializer
