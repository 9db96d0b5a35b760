#pragma once

#include "ledcast/v1/types.pb.h"
#include "ledcast/v1/catalog.pb.h"
