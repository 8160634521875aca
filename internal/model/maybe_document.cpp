#include "internal/model/maybe_document.hpp"

#include <type_traits>

namespace doccache::model {

std::string DescribeVariant(const MaybeDocument& doc) {
  return std::visit(
      [](const auto& d) -> std::string {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, Document>) {
          return "Document";
        } else if constexpr (std::is_same_v<T, NoDocument>) {
          return "NoDocument";
        } else {
          static_assert(std::is_same_v<T, UnknownDocument>);
          return "UnknownDocument";
        }
      },
      doc);
}

} // namespace doccache::model
