#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace tether {
namespace session {

// Boolean reachability source with change notifications
class NetworkMonitor {
public:
    using ObserverId = uint64_t;
    using Observer = std::function<void(bool available)>;

    virtual ~NetworkMonitor() = default;

    virtual bool is_available() const = 0;

    // Observers are called on every availability change, never while the
    // monitor holds its own lock
    virtual ObserverId add_observer(Observer observer) = 0;

    // Once this returns the observer is not running and will not be called
    // again. Must not be called from inside an observer.
    virtual void remove_observer(ObserverId id) = 0;
};

// Monitor driven by explicit set_available() calls (CLI commands, tests,
// or an embedding application bridging the OS signal)
class ManualNetworkMonitor : public NetworkMonitor {
public:
    explicit ManualNetworkMonitor(bool initially_available = true);

    bool is_available() const override;
    ObserverId add_observer(Observer observer) override;
    void remove_observer(ObserverId id) override;

    // Notifies observers only when the value changes
    void set_available(bool available);

private:
    std::atomic<bool> available_;

    mutable std::mutex mutex_;
    std::map<ObserverId, Observer> observers_;
    ObserverId next_id_ = 1;

    // Keeps notifications for successive changes from interleaving
    std::mutex dispatch_mutex_;
};

}  // namespace session
}  // namespace tether
