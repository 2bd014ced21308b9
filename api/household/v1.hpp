#pragma once

#include "household/v1/topology.pb.h"
