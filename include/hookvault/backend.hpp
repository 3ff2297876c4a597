#pragma once

#include "hookvault/codec.hpp"
#include "hookvault/http.hpp"
#include "hookvault/retry.hpp"
#include "hookvault/vault_config.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace hookvault {

/// Where a stored blob lives on its host. Stable once returned by upload().
struct BlobRef {
    std::string url;
    std::string message_id;
    std::string webhook_id;  // id of the backend that holds the blob
    std::string file_id;     // provider-side file handle (Telegram only)
};

/// Abstract interface for attachment hosts.
///
/// Every call retries transient failures internally (see execute_with_backoff)
/// and throws hookvault::Error once it gives up:
///   - Configuration when credentials are missing, before any network call
///   - FatalBackend for non-retryable 4xx or a malformed success response,
///     with retries_exhausted set when the retry budget ran out
///   - NotFound when the remote object no longer exists
///   - Cancelled when `cancel` was raised during fetch()
class BlobBackend {
public:
    virtual ~BlobBackend() = default;

    // Backend type name (for logging)
    virtual std::string type_name() const = 0;

    virtual const std::string& id() const = 0;

    // Whether the backend has the credentials it needs
    virtual bool ready() const = 0;

    virtual BlobRef upload(const crypto::Bytes& data, const std::string& filename,
                           const std::string& caption) = 0;

    virtual crypto::Bytes fetch(const BlobRef& ref, const std::atomic<bool>* cancel = nullptr) = 0;

    virtual void remove(const BlobRef& ref) = 0;
};

/// Shared settings for every backend built by the factory.
struct BackendOptions {
    RetryContext retry;
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds request_timeout{120000};
    std::shared_ptr<net::HttpTransport> transport;  // null: a curl client is created
    std::string telegram_api_base = "https://api.telegram.org";
};

class BlobBackendFactory {
public:
    /// Create a backend from its configuration. Throws std::runtime_error for
    /// an unknown type.
    static std::unique_ptr<BlobBackend> create(const BackendConfig& config,
                                               const BackendOptions& options);
};

/// All configured backends. Part uploads are spread round-robin by part
/// index; fetch and delete go to the backend recorded on the part.
class BackendPool {
public:
    void add(std::unique_ptr<BlobBackend> backend);

    size_t size() const { return backends_.size(); }
    bool empty() const { return backends_.empty(); }

    /// Upload target for part `index`: backends[index % size]. Throws
    /// Error{Configuration} when the pool is empty.
    BlobBackend& for_part(uint32_t index) const;

    /// Backend holding blobs recorded under `webhook_id`, or null.
    BlobBackend* find(const std::string& webhook_id) const;

private:
    std::vector<std::unique_ptr<BlobBackend>> backends_;
};

}  // namespace hookvault
