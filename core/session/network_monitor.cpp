#include "network_monitor.hpp"

#include <vector>

#include "logging/logger.hpp"

namespace tether {
namespace session {

ManualNetworkMonitor::ManualNetworkMonitor(bool initially_available) : available_(initially_available) {}

bool ManualNetworkMonitor::is_available() const { return available_.load(); }

NetworkMonitor::ObserverId ManualNetworkMonitor::add_observer(Observer observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    ObserverId id = next_id_++;
    observers_.emplace(id, std::move(observer));
    return id;
}

void ManualNetworkMonitor::remove_observer(ObserverId id) {
    std::lock_guard<std::mutex> dispatch(dispatch_mutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.erase(id);
}

void ManualNetworkMonitor::set_available(bool available) {
    std::lock_guard<std::mutex> dispatch(dispatch_mutex_);

    if (available_.exchange(available) == available) {
        return;
    }

    LOG_INFO("[Network] Network " << (available ? "available" : "unavailable"));

    std::vector<Observer> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets.reserve(observers_.size());
        for (const auto &[id, observer] : observers_) {
            static_cast<void>(id);
            targets.push_back(observer);
        }
    }

    for (auto &observer : targets) {
        observer(available);
    }
}

}  // namespace session
}  // namespace tether
