#pragma once

#include <memory>

namespace tables::db { class Repository; }

namespace tables::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<tables::db::Repository> repository;
};

}
