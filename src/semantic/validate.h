#pragma once
#include "request.h"
#include "ports.h"

namespace Validate {
    VoidResult request(const ChatRequest& req);
}
