#pragma once

#include "vodbridge/content/v1/cache.pb.h"
#include "vodbridge/content/v1/entities.pb.h"
#include "vodbridge/content/v1/readiness.pb.h"
