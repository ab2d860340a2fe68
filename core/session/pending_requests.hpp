#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "rpc/errors.hpp"
#include "rpc/json_rpc.hpp"

namespace tether {
namespace session {

// Outcome of one outbound request: a response or an error, never both
struct RequestResult {
    std::optional<rpc::Response> response;
    std::optional<rpc::ClientError> error;

    bool ok() const { return response.has_value(); }

    static RequestResult success(rpc::Response response);
    static RequestResult failure(rpc::ClientError error);
};

using Completion = std::function<void(RequestResult)>;

// Monotonic integer ids shared by every session of one manager, so a late
// response from a retired socket can never match a newer request.
class RequestIdSequence {
public:
    rpc::MessageId next() { return rpc::MessageId(next_id_.fetch_add(1, std::memory_order_relaxed)); }

private:
    std::atomic<int64_t> next_id_{1};
};

// Outbound requests waiting for their response, keyed by id.
// Every entry completes exactly once: resolve(), fail_all() and remove()
// all take the entry out of the map before the completion runs, and
// completions always run with the lock released.
class PendingRequestStore {
public:
    // False if the id is already pending; completion is then left untouched
    bool add(const rpc::MessageId &id, Completion &&completion);

    // Completes and removes the entry for id. False if id is unknown.
    bool resolve(const rpc::MessageId &id, RequestResult result);

    // Drops the entry without completing it, returning its completion.
    std::optional<Completion> remove(const rpc::MessageId &id);

    // Completes every entry with error; returns how many there were
    size_t fail_all(const rpc::ClientError &error);

    size_t size() const;
    bool contains(const rpc::MessageId &id) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<rpc::MessageId, Completion> pending_;
};

}  // namespace session
}  // namespace tether
