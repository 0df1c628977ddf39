#pragma once

#include <memory>

namespace treasury::core { class LedgerManager; }

namespace treasury::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<treasury::core::LedgerManager> manager;
};

}
