#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/cache/remote_document_cache.hpp"
#include "internal/db/api/repository.hpp"

namespace doccache::factory {

/*
  RuntimeDependencies

  Owns the long-lived objects a process needs to use the cache.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::Repository>             repository;
  std::shared_ptr<cache::RemoteDocumentCache> remote_document_cache;
};

/*
  Build

  Constructs the store and the cache from runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
RuntimeDependencies Build(const doccache::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const doccache::runtime::config::RuntimeConfig& config);

} // namespace doccache::factory
