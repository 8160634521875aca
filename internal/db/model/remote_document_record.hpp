#pragma once

#include <string>

namespace doccache::db::model {

/*
  Persistent remote_documents row.

  path:     EncodedPath of the document key (BLOB, memcmp ordering)
  contents: LocalSerializer output
*/

struct RemoteDocumentRecord {
  std::string path;
  std::string contents;
};

}
