#include "pending_requests.hpp"

#include <utility>
#include <vector>

#include "logging/logger.hpp"

namespace tether {
namespace session {

RequestResult RequestResult::success(rpc::Response response) {
    RequestResult result;
    result.response = std::move(response);
    return result;
}

RequestResult RequestResult::failure(rpc::ClientError error) {
    RequestResult result;
    result.error = std::move(error);
    return result;
}

bool PendingRequestStore::add(const rpc::MessageId &id, Completion &&completion) {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.try_emplace(id, std::move(completion)).second;
}

bool PendingRequestStore::resolve(const rpc::MessageId &id, RequestResult result) {
    Completion completion;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return false;
        }
        completion = std::move(it->second);
        pending_.erase(it);
    }

    if (completion) {
        completion(std::move(result));
    }
    return true;
}

std::optional<Completion> PendingRequestStore::remove(const rpc::MessageId &id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return std::nullopt;
    }
    Completion completion = std::move(it->second);
    pending_.erase(it);
    return completion;
}

size_t PendingRequestStore::fail_all(const rpc::ClientError &error) {
    std::vector<Completion> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.reserve(pending_.size());
        for (auto &[id, completion] : pending_) {
            static_cast<void>(id);
            drained.push_back(std::move(completion));
        }
        pending_.clear();
    }

    if (!drained.empty()) {
        LOG_DEBUG("[Pending] Failing " << drained.size() << " pending request(s): " << error.describe());
    }

    for (auto &completion : drained) {
        if (completion) {
            completion(RequestResult::failure(error));
        }
    }
    return drained.size();
}

size_t PendingRequestStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool PendingRequestStore::contains(const rpc::MessageId &id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(id) > 0;
}

}  // namespace session
}  // namespace tether
