#pragma once

#include "core/plugin/ModeProfile.hpp"
#include "core/plugin/PluginError.hpp"

namespace pem {

struct ProbeSettings {
    int attempts = 3;
    int timeoutMs = 5000;
    int delayMs = 1000;
};

/// Bounded-retry reachability check against a mode's connect-test URL.
/// Blocks the calling thread; run it on a worker.
class ConnectivityProbe {
public:
    explicit ConnectivityProbe(ProbeSettings settings = {});

    /// Success as soon as one attempt returns a non-empty body.
    Status check(const ModeProfile& profile) const;

    const ProbeSettings& settings() const { return settings_; }

private:
    ProbeSettings settings_;
};

} // namespace pem
