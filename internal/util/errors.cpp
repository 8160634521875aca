#include "internal/util/errors.hpp"

namespace doccache::util {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::Corruption:
      throw Corruption(message);
    case db::ErrorCode::Conflict:
    case db::ErrorCode::SerializationFailure:
      throw TransactionConflict(message);
    default:
      throw StoreFailure(result.code, message);
  }
}

} // namespace doccache::util
