#pragma once

#include "ota/update_descriptor.hpp"
#include "util/result.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>

namespace otafetch {

// A network path handed out by the connectivity source.
struct Network {
    std::string name;
    std::uint64_t handle = 0;

    bool operator==(const Network&) const = default;
};

class IMetadataProvider {
public:
    virtual ~IMetadataProvider() = default;
    // nullopt when the server has nothing newer than the installed build.
    virtual std::expected<std::optional<UpdateDescriptor>, std::string> Fetch() = 0;
};

class ITransferProvider {
public:
    // QueryProgressBytes() result for a transfer that ended without success,
    // was released, or never started.
    static constexpr std::int64_t kTerminated = -1;

    virtual ~ITransferProvider() = default;

    virtual bool HasTargetSet() const = 0;
    virtual Result SetTarget(const UpdateDescriptor& descriptor) = 0;

    // Begins writing `destination` from `resume_offset`. Does not block on the transfer.
    virtual Result Start(const std::string& destination,
                         const std::optional<Network>& network,
                         std::uint64_t resume_offset) = 0;

    // Cumulative bytes on disk for the current transfer, or kTerminated.
    virtual std::int64_t QueryProgressBytes() = 0;

    // Blocks until the byte count differs from `last_seen`, the transfer
    // stops, or `timeout` elapses. Returns false when the provider has no
    // change notification and the caller has to sleep instead.
    virtual bool WaitForChange(std::int64_t /*last_seen*/, std::chrono::milliseconds /*timeout*/) {
        return false;
    }

    // Stops the transfer and frees connections and buffers. Idempotent.
    virtual void Release() = 0;
};

enum class NetworkEventKind {
    kAvailable,
    kLost,
};

struct NetworkEvent {
    NetworkEventKind kind = NetworkEventKind::kAvailable;
    Network network;
};

class IConnectivitySource {
public:
    using Callback = std::function<void(const NetworkEvent&)>;

    virtual ~IConnectivitySource() = default;
    // Events for the default network. A source may replay the current state.
    virtual void Subscribe(Callback callback) = 0;
    // No callback runs after this returns.
    virtual void Unsubscribe() = 0;
};

inline constexpr const char* kDefaultDownloadDirectory = "/var/lib/ota-fetcher/downloads";

class ISettingsStore {
public:
    virtual ~ISettingsStore() = default;
    virtual std::string GetDownloadDirectory() const = 0;
    virtual Result SetDownloadDirectory(const std::string& dir) = 0;
};

} // namespace otafetch
