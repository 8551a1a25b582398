#pragma once

#include "millsync/v1/entities.pb.h"
#include "millsync/v1/mutation.pb.h"
#include "millsync/v1/remote.pb.h"
