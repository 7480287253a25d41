#pragma once

#include "vaultd/daemon/v1/control.pb.h"
#include "vaultd/daemon/v1/control.grpc.pb.h"
