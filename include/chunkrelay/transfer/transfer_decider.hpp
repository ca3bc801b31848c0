#pragma once

#include "chunkrelay/network/protocol.hpp"
#include <functional>
#include <string>
#include <vector>

namespace chunkrelay::transfer {

enum class Decision {
    Accept,
    Reject
};

// Accept/reject policy for incoming transfer requests. The callback may be
// invoked inline or later from any thread, exactly once.
class TransferDecider {
public:
    using Callback = std::function<void(Decision)>;

    virtual ~TransferDecider() = default;
    virtual void decide(const network::TransferRequest& request, Callback callback) = 0;
};

// Accepts requests whose content type starts with one of the given prefixes.
// An empty prefix list accepts everything.
class AutoAcceptDecider : public TransferDecider {
public:
    explicit AutoAcceptDecider(std::vector<std::string> content_prefixes = {});

    void decide(const network::TransferRequest& request, Callback callback) override;

private:
    std::vector<std::string> content_prefixes_;
};

} // namespace chunkrelay::transfer
