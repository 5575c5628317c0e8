#pragma once

#include "streamlift/v1/conversion.pb.h"
#include "streamlift/v1/media_api.pb.h"
#include "streamlift/v1/probe.pb.h"

#include "streamlift/v1/worker_service.pb.h"
#include "streamlift/v1/worker_service.grpc.pb.h"
