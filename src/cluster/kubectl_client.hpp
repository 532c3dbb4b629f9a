#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include "cluster_client.hpp"

class SSHConnection;

// ClusterClient backed by kubectl on the remote host. Reads use
// "-o json"; JSON is valid YAML, so yaml-cpp does the parsing.
class KubectlClient : public ClusterClient {
public:
    KubectlClient(SSHConnection& conn, const KubectlConfig& config);

    Result<std::vector<Secret>> list_secrets(const std::string& ns,
                                             const std::string& selector) override;
    Result<void> create_secret(const Secret& secret) override;
    StoreResult delete_secret(const std::string& ns, const std::string& name) override;

    Result<ServiceAccount> get_service_account(const std::string& ns,
                                               const std::string& name) override;
    Result<void> update_image_pull_secrets(const ServiceAccount& sa) override;

    Result<std::string> get_pod_ip(const std::string& ns, const std::string& name) override;

    // "kubectl [--context C] <args>", each piece shell-quoted.
    std::string command(const std::vector<std::string>& args) const;

private:
    SSHConnection& conn_;
    KubectlConfig config_;

    SSHResult run(const std::vector<std::string>& args);
    SSHResult run_with_input(const std::vector<std::string>& args, const std::string& input);
};

// ── JSON helpers (exposed for tests) ────────────────────────

Result<std::vector<Secret>> parse_secret_list(const std::string& json);
Result<ServiceAccount> parse_service_account(const std::string& json);
std::string secret_manifest(const Secret& secret);
std::string image_pull_secrets_patch(const std::vector<std::string>& names);

// kubectl reports a missing object as 'Error from server (NotFound): ...'
bool is_not_found_error(const std::string& stderr_text);
