#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/maybe_document.hpp"
#include "internal/model/query.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

using doccache::model::Document;
using doccache::model::DocumentKey;
using doccache::model::MaybeDocument;
using doccache::model::NoDocument;
using doccache::model::Query;
using doccache::model::ResourcePath;
using doccache::model::SnapshotVersion;
using doccache::model::UnknownDocument;

static void Usage() {
  std::cout << "Usage:\n"
            << "  doccachectl <config.yaml> put <path> <version_seconds> <data>\n"
            << "  doccachectl <config.yaml> tombstone <path> <version_seconds>\n"
            << "  doccachectl <config.yaml> unknown <path> <version_seconds>\n"
            << "  doccachectl <config.yaml> get <path>\n"
            << "  doccachectl <config.yaml> getall <path> [path...]\n"
            << "  doccachectl <config.yaml> rm <path>\n"
            << "  doccachectl <config.yaml> query <collection_path> [substring]\n";
}

static SnapshotVersion ParseVersion(const std::string& value) {
  if (value == "now") {
    return doccache::util::ToSnapshotVersion(doccache::util::Now());
  }
  return SnapshotVersion{static_cast<int64_t>(std::stoll(value)), 0};
}

static void Print(const MaybeDocument& doc) {
  std::visit(
      [](const auto& d) {
        using T = std::decay_t<decltype(d)>;
        std::cout << d.key.ToString() << " version=" << d.version.seconds << "." << d.version.nanos;
        if constexpr (std::is_same_v<T, Document>) {
          std::cout << " exists=true data=" << d.data;
        } else if constexpr (std::is_same_v<T, NoDocument>) {
          std::cout << " exists=false";
        } else {
          std::cout << " exists=unknown";
        }
        std::cout << "\n";
      },
      doc);
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string config_path = argv[1];
  std::string cmd         = argv[2];
  std::vector<std::string> args(argv + 3, argv + argc);

  try {
    auto config = doccache::config::ConfigLoader::LoadFromYaml(config_path);
    doccache::observability::InitializeLogging(config);

    auto deps   = doccache::factory::Build(config);
    auto& cache = *deps.remote_document_cache;
    auto tx     = deps.repository->Begin();

    int rc = 0;

    // ------------------------------------------------------------

    if (cmd == "put") {
      if (args.size() < 3) {
        Usage();
        return 1;
      }
      cache.Add(*tx, Document{DocumentKey::FromPathString(args[0]), ParseVersion(args[1]), args[2]});
      std::cout << "added\n";
    }

    // ------------------------------------------------------------

    else if (cmd == "tombstone" || cmd == "unknown") {
      if (args.size() < 2) {
        Usage();
        return 1;
      }
      auto key     = DocumentKey::FromPathString(args[0]);
      auto version = ParseVersion(args[1]);
      if (cmd == "tombstone") {
        cache.Add(*tx, NoDocument{std::move(key), version});
      } else {
        cache.Add(*tx, UnknownDocument{std::move(key), version});
      }
      std::cout << "added\n";
    }

    // ------------------------------------------------------------

    else if (cmd == "get") {
      if (args.empty()) {
        Usage();
        return 1;
      }
      auto doc = cache.Get(*tx, DocumentKey::FromPathString(args[0]));
      if (doc.has_value()) {
        Print(*doc);
      } else {
        std::cout << "not found\n";
        rc = 3;
      }
    }

    // ------------------------------------------------------------

    else if (cmd == "getall") {
      if (args.empty()) {
        Usage();
        return 1;
      }
      std::vector<DocumentKey> keys;
      for (const auto& path : args) {
        keys.push_back(DocumentKey::FromPathString(path));
      }
      auto docs = cache.GetAll(*tx, keys);
      for (const auto& doc : docs) {
        Print(doc);
      }
      std::cout << "found=" << docs.size() << "\n";
    }

    // ------------------------------------------------------------

    else if (cmd == "rm") {
      if (args.empty()) {
        Usage();
        return 1;
      }
      cache.Remove(*tx, DocumentKey::FromPathString(args[0]));
      std::cout << "removed\n";
    }

    // ------------------------------------------------------------

    else if (cmd == "query") {
      if (args.empty()) {
        Usage();
        return 1;
      }
      auto query = Query::AtPath(ResourcePath::FromString(args[0]));
      if (args.size() >= 2) {
        auto needle = args[1];
        query       = query.WithFilter([needle](const Document& doc) { return doc.data.find(needle) != std::string::npos; });
      }
      auto results = cache.GetAllMatchingQuery(*tx, query);
      for (const auto& [key, doc] : results) {
        Print(doc);
      }
      std::cout << "matched=" << results.size() << "\n";
    }

    // ------------------------------------------------------------

    else {
      std::cerr << "unknown command: " << cmd << "\n";
      Usage();
      return 1;
    }

    tx->Commit();
    doccache::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    doccache::observability::ShutdownLogging();
    return 2;
  }
}
