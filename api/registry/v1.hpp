#pragma once

#include "registry/v1/asset.pb.h"
#include "registry/v1/registry_service.pb.h"
