#include "validate.h"

namespace Validate {

VoidResult request(const ChatRequest& req) {
    if (req.messages.isEmpty())
        return std::unexpected(DomainFailure::invalidInput(
            "empty_messages", "messages字段不能为空"));
    return {};
}

}
