#include "chunkrelay/transfer/transfer_decider.hpp"
#include "chunkrelay/core/logger.hpp"
#include <algorithm>

namespace chunkrelay::transfer {

AutoAcceptDecider::AutoAcceptDecider(std::vector<std::string> content_prefixes)
    : content_prefixes_(std::move(content_prefixes)) {
}

void AutoAcceptDecider::decide(const network::TransferRequest& request, Callback callback) {
    bool accepted = content_prefixes_.empty() ||
        std::any_of(content_prefixes_.begin(), content_prefixes_.end(), [&](const std::string& prefix) {
            return request.content_type.starts_with(prefix);
        });

    if (!accepted) {
        LOG_INFO("Declining {} ({}): content type not auto-accepted", request.file_name, request.content_type);
    }
    callback(accepted ? Decision::Accept : Decision::Reject);
}

} // namespace chunkrelay::transfer
