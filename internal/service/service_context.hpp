#pragma once

#include <memory>

#include "internal/model/profile.hpp"

namespace renter::engine { class RenterEngine; }

namespace renter::service {

/*
  Dependency container handed to the control service.
*/
struct ServiceContext {
  std::shared_ptr<renter::engine::RenterEngine> engine;
  renter::model::Profile profile = renter::model::Profile::kStandard;
};

}
