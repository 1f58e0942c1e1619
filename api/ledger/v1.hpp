#pragma once

#include "ledger/v1/types.pb.h"
#include "ledger/v1/ledger_service.pb.h"
