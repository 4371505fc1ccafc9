#pragma once

/**
 * @file lifecycle.h
 * @brief Initialization state machine for one effect instance
 *
 * Effects initialize asynchronously (media open, depth load, model load,
 * backend probe). The controller guarantees at most one initialization is
 * in flight and that a superseded attempt can never mark the effect ready:
 *
 * - Uninitialized: attribute changes start an attempt once every required
 *   attribute is present.
 * - Initializing: further changes are absorbed; the running attempt reads
 *   the latest attributes when it completes.
 * - Ready: a change tears the effect down and starts a fresh attempt.
 *
 * Each attempt owns its own CancellationToken, so a late completion from a
 * cancelled attempt is recognised and ignored.
 */

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace layershift {

class CancellationToken {
public:
    CancellationToken() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    bool cancelled() const { return m_flag->load(); }
    void cancel() { m_flag->store(true); }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

enum class LifecycleState {
    Uninitialized,
    Initializing,
    Ready
};

const char* lifecycleStateName(LifecycleState state);

/// Handed to the effect for one initialization attempt
struct InitAttempt {
    uint64_t id = 0;
    CancellationToken token;
};

/// The effect side of the lifecycle
class ManagedEffect {
public:
    virtual ~ManagedEffect() = default;

    /// Attributes whose changes trigger re-init
    virtual std::vector<std::string> reinitAttributes() const = 0;

    /// Whether an attempt can start; by default every reinit attribute must be non-empty
    virtual bool canInit(const std::map<std::string, std::string>& attributes) const;

    /// Prepare host-side structure; called on connect and before each re-init
    virtual void setup() {}

    /**
     * @brief Start an initialization attempt
     *
     * May complete synchronously or later. On success the effect calls
     * LifecycleController::markInitialized(attempt); on failure
     * markFailed(attempt, message). Exceptions thrown from here count as
     * failure.
     */
    virtual void doInit(const InitAttempt& attempt) = 0;

    /// Release everything doInit created; must tolerate partial state
    virtual void doDispose() = 0;
};

class LifecycleController {
public:
    using ErrorCallback = std::function<void(const std::string& message)>;

    explicit LifecycleController(ManagedEffect& effect);

    void onConnect();
    void onDisconnect();

    /**
     * @brief Report an attribute change
     *
     * Ignored for attributes outside reinitAttributes() and for no-op
     * changes (old == new).
     */
    void onAttributeChange(const std::string& name,
                           const std::optional<std::string>& oldValue,
                           const std::optional<std::string>& newValue);

    /// @brief Store an attribute and report the change
    void setAttribute(const std::string& name, const std::string& value);
    void removeAttribute(const std::string& name);
    std::optional<std::string> attribute(const std::string& name) const;
    const std::map<std::string, std::string>& attributes() const { return m_attributes; }

    /// @return false if the attempt was superseded or cancelled
    bool markInitialized(const InitAttempt& attempt);
    void markFailed(const InitAttempt& attempt, const std::string& message);

    void onError(ErrorCallback cb) { m_onError = std::move(cb); }

    LifecycleState state() const { return m_state; }
    bool connected() const { return m_connected; }
    bool isInitialized() const { return m_state == LifecycleState::Ready; }

    /// Number of doInit calls so far
    uint64_t attemptCount() const { return m_nextAttempt - 1; }

private:
    void tryInit();
    void cancelInit();
    bool isCurrent(const InitAttempt& attempt) const;

    ManagedEffect& m_effect;
    LifecycleState m_state = LifecycleState::Uninitialized;
    bool m_connected = false;
    std::map<std::string, std::string> m_attributes;

    std::optional<InitAttempt> m_current;
    uint64_t m_nextAttempt = 1;
    ErrorCallback m_onError;
};

} // namespace layershift
