#pragma once

#include "muse/autonomous/v1/types.pb.h"

#include "muse/generation/v1/generation.pb.h"
#include "muse/generation/v1/generation.grpc.pb.h"

namespace muse::autonomous::v1 {
using namespace ::muse::generation::v1;
}
