#pragma once

// Umbrella header for the renter.control.v1 message types.

#include "google/protobuf/empty.pb.h"
#include "renter/control/v1/types.pb.h"
#include "renter/control/v1/bundle.pb.h"
#include "renter/control/v1/renter_service.pb.h"
