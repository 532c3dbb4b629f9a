#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include "resources.hpp"

// Narrow view of the cluster API used by the registry and profiling
// commands. Implementations must be safe to call from several threads at
// once: BulkDeleter issues delete_secret() concurrently.
class ClusterClient {
public:
    virtual ~ClusterClient() = default;

    virtual Result<std::vector<Secret>> list_secrets(const std::string& ns,
                                                     const std::string& selector) = 0;
    virtual Result<void> create_secret(const Secret& secret) = 0;
    virtual StoreResult delete_secret(const std::string& ns, const std::string& name) = 0;

    virtual Result<ServiceAccount> get_service_account(const std::string& ns,
                                                       const std::string& name) = 0;
    virtual Result<void> update_image_pull_secrets(const ServiceAccount& sa) = 0;

    virtual Result<std::string> get_pod_ip(const std::string& ns, const std::string& name) = 0;
};
