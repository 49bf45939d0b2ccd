#pragma once

#include "catalog/management/v1/warehouse.pb.h"

namespace catalog::v1 {
using namespace ::catalog::management::v1;
}
