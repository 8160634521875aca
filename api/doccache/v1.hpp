#pragma once

#include "doccache/local/v1/maybe_document.pb.h"

namespace doccache::v1 {
using namespace ::doccache::local::v1;
}
